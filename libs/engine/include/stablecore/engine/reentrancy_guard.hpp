#pragma once

#include <atomic>

namespace stablecore {
namespace engine {

// Engine-wide held/free flag. A Scope that fails to acquire must reject the
// call; the flag is released when the acquiring Scope goes away.
class ReentrancyGuard {
 public:
  class Scope {
   public:
    explicit Scope(ReentrancyGuard& guard) noexcept
        : guard_(guard), acquired_(!guard.held_.exchange(true, std::memory_order_acq_rel)) {}
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;
    ~Scope() {
      if (acquired_) {
        guard_.held_.store(false, std::memory_order_release);
      }
    }

    [[nodiscard]] bool acquired() const noexcept { return acquired_; }

   private:
    ReentrancyGuard& guard_;
    bool acquired_;
  };

  [[nodiscard]] bool held() const noexcept { return held_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> held_{false};
};

}  // namespace engine
}  // namespace stablecore
