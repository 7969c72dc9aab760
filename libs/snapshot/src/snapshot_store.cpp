#include "stablecore/snapshot/snapshot_store.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include "stablecore/snapshot/ledger_codec.hpp"
#include "stablecore/wal/wal_writer.hpp"

namespace stablecore {
namespace snapshot {

namespace {

constexpr std::uint32_t kMagic = 0x4c43534e;  // 'NSCL'
constexpr std::uint16_t kFormat = 2;

// [magic:4][format:2][reserved:2][sequence:8][ledger_size:4][checksum:4]
struct Frame {
  std::uint32_t magic{kMagic};
  std::uint16_t format{kFormat};
  std::uint16_t reserved{0};
  common::SequenceId sequence{0};
  std::uint32_t ledger_size{0};
  std::uint32_t checksum{0};
};

struct FileCloser {
  void operator()(std::FILE* file) const noexcept { std::fclose(file); }
};

void write_all(std::FILE* file, const void* data, std::size_t size, const std::filesystem::path& path) {
  if (size > 0 && std::fwrite(data, 1, size, file) != size) {
    throw std::runtime_error("short write to snapshot " + path.string());
  }
}

}  // namespace

Store::Store(const std::filesystem::path& directory) : path_(directory / "ledger.snap") {
  std::filesystem::create_directories(directory);
}

void Store::persist(common::SequenceId sequence, const ledger::LedgerState& ledger) {
  const auto image = encode_ledger(ledger);
  Frame frame;
  frame.sequence = sequence;
  frame.ledger_size = static_cast<std::uint32_t>(image.size());
  frame.checksum = wal::checksum32(image);

  auto staging = path_;
  staging += ".tmp";
  {
    std::unique_ptr<std::FILE, FileCloser> out(std::fopen(staging.c_str(), "wb"));
    if (!out) {
      throw std::system_error(errno, std::system_category(), "cannot create " + staging.string());
    }
    write_all(out.get(), &frame, sizeof(frame), staging);
    write_all(out.get(), image.data(), image.size(), staging);
    if (std::fflush(out.get()) != 0 || ::fsync(::fileno(out.get())) != 0) {
      throw std::system_error(errno, std::system_category(), "cannot flush " + staging.string());
    }
  }
  std::filesystem::rename(staging, path_);
}

std::optional<LedgerSnapshot> Store::latest() const {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    if (std::filesystem::exists(path_)) {
      throw std::runtime_error("cannot open snapshot " + path_.string());
    }
    return std::nullopt;
  }
  const std::vector<char> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

  Frame frame;
  if (bytes.size() < sizeof(frame)) {
    throw std::runtime_error("snapshot " + path_.string() + " is shorter than its frame");
  }
  std::memcpy(&frame, bytes.data(), sizeof(frame));
  if (frame.magic != kMagic || frame.format != kFormat) {
    throw std::runtime_error("snapshot " + path_.string() + " has an unknown format");
  }
  if (bytes.size() - sizeof(frame) != frame.ledger_size) {
    throw std::runtime_error("snapshot " + path_.string() + " holds " + std::to_string(bytes.size() - sizeof(frame)) +
                             " ledger bytes, frame says " + std::to_string(frame.ledger_size));
  }

  const std::span<const std::byte> image(reinterpret_cast<const std::byte*>(bytes.data()) + sizeof(frame),
                                         frame.ledger_size);
  if (wal::checksum32(image) != frame.checksum) {
    throw std::runtime_error("snapshot checksum mismatch at sequence " + std::to_string(frame.sequence));
  }
  return LedgerSnapshot{.sequence = frame.sequence, .ledger = decode_ledger(image)};
}

}  // namespace snapshot
}  // namespace stablecore
