#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "stablecore/common/types.hpp"
#include "stablecore/oracle/price_feed.hpp"

namespace stablecore {
namespace risk {

inline constexpr common::Amount kLiquidationPrecision = 100;

struct RiskParameters {
  common::Amount liquidation_threshold{50};  // percent of collateral value counted
  common::Amount liquidation_bonus{10};      // percent on top of the seized base
  common::Amount min_health_factor{common::kPrecision};
};

// Approved collateral assets and their oracle references, fixed at
// construction. Throws common::EngineError(kConfigurationMismatch) when the
// two lists differ in length or an asset id repeats.
class AssetRegistry {
 public:
  AssetRegistry(std::vector<common::AssetId> assets, std::vector<oracle::FeedRef> feeds);

  [[nodiscard]] bool contains(common::AssetId asset) const;
  [[nodiscard]] std::optional<oracle::FeedRef> feed_for(common::AssetId asset) const;
  [[nodiscard]] const std::vector<common::AssetId>& assets() const noexcept { return assets_; }
  [[nodiscard]] std::size_t size() const noexcept { return assets_.size(); }

 private:
  std::vector<common::AssetId> assets_;
  std::map<common::AssetId, oracle::FeedRef> feeds_;
};

}  // namespace risk
}  // namespace stablecore
