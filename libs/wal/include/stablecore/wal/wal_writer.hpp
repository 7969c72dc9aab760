#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

#include "stablecore/common/types.hpp"
#include "stablecore/ledger/events.hpp"

namespace stablecore {
namespace wal {

inline constexpr std::uint32_t kMagic = 0x53434556;  // 'SCEV'
inline constexpr std::uint16_t kVersion = 1;

struct RecordHeader {
  std::uint32_t magic{kMagic};
  std::uint16_t version{kVersion};
  std::uint16_t reserved{0};
  common::SequenceId sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

// FNV-1a over the payload bytes.
[[nodiscard]] std::uint32_t checksum32(std::span<const std::byte> data) noexcept;

// Append-only record log. Sequences continue from the last valid record
// already in the file; a torn record left by a crash mid-append is cut off
// before new records are written. Writes are buffered until
// flush_threshold_bytes.
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes = 1 << 16);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  ~Writer();

  // Returns the sequence assigned to the record.
  common::SequenceId append(std::span<const std::byte> payload);
  void flush();
  void sync();
  [[nodiscard]] common::SequenceId next_sequence() const noexcept { return next_sequence_; }
  [[nodiscard]] common::SequenceId last_sequence() const noexcept { return next_sequence_ - 1; }

 private:
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  common::SequenceId next_sequence_{1};
};

// Throws std::runtime_error on bad magic, unsupported version or a checksum
// mismatch. A record cut short by the end of the file ends the log and is
// reported by torn_tail().
class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  ~Reader();

  bool next(Record& out_record);
  // Positions the reader on the first record with sequence >= `sequence`.
  void seek_sequence(common::SequenceId sequence);

  [[nodiscard]] bool torn_tail() const noexcept { return torn_tail_; }
  // Byte offset just past the last record next() returned.
  [[nodiscard]] std::uintmax_t valid_end() const noexcept { return valid_end_; }

 private:
  std::FILE* file_{nullptr};
  bool torn_tail_{false};
  std::uintmax_t valid_end_{0};
};

// Event sink that appends every committed event to the WAL.
class EventJournal : public ledger::EventSink {
 public:
  explicit EventJournal(Writer& writer) : writer_(writer) {}

  void publish(const ledger::Event& event) override;
  [[nodiscard]] std::size_t appended() const noexcept { return appended_; }

 private:
  Writer& writer_;
  std::size_t appended_{0};
};

}  // namespace wal
}  // namespace stablecore
