#include "stablecore/wal/wal_writer.hpp"

#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <unistd.h>

namespace stablecore {
namespace wal {

namespace {

void fsync_file(std::FILE* file) {
  if (::fsync(::fileno(file)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
}

}  // namespace

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : flush_threshold_(flush_threshold_bytes) {
  buffer_.reserve(flush_threshold_bytes);

  if (std::filesystem::exists(path)) {
    std::uintmax_t valid_end = 0;
    {
      Reader reader(path);
      Record record;
      while (reader.next(record)) {
        next_sequence_ = record.header.sequence + 1;
      }
      valid_end = reader.valid_end();
    }
    const auto size = std::filesystem::file_size(path);
    if (size > valid_end) {
      std::cerr << "wal: dropping " << (size - valid_end) << " bytes of torn record at end of " << path << '\n';
      std::filesystem::resize_file(path, valid_end);
    }
  }

  file_ = std::fopen(path.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open WAL file: " + path.string());
  }
}

Writer::~Writer() {
  try {
    flush();
  } catch (const std::exception& e) {
    std::cerr << "wal: dropping " << buffer_.size() << " buffered bytes: " << e.what() << '\n';
  }
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

common::SequenceId Writer::append(std::span<const std::byte> payload) {
  if (!file_) {
    throw std::runtime_error("WAL writer not open");
  }

  RecordHeader header;
  header.sequence = next_sequence_;
  header.payload_size = static_cast<std::uint32_t>(payload.size());
  header.checksum = checksum32(payload);

  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  buffer_.insert(buffer_.end(), header_bytes.begin(), header_bytes.end());
  buffer_.insert(buffer_.end(), payload.begin(), payload.end());
  ++next_sequence_;

  if (buffer_.size() >= flush_threshold_) {
    flush();
  }
  return header.sequence;
}

void Writer::flush() {
  if (!file_ || buffer_.empty()) {
    return;
  }

  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    throw std::runtime_error("failed to write WAL buffer");
  }
  buffer_.clear();
  if (std::fflush(file_) != 0) {
    throw std::system_error(errno, std::system_category(), "WAL fflush failed");
  }
}

void Writer::sync() {
  flush();
  if (file_) {
    fsync_file(file_);
  }
}

Reader::Reader(const std::filesystem::path& path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open WAL for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  if (!file_) {
    return false;
  }

  RecordHeader header;
  const auto header_read = std::fread(&header, 1, sizeof(RecordHeader), file_);
  if (header_read != sizeof(RecordHeader)) {
    torn_tail_ = header_read > 0;
    return false;
  }

  if (header.magic != kMagic) {
    throw std::runtime_error("invalid WAL magic");
  }
  if (header.version != kVersion) {
    throw std::runtime_error("unsupported WAL version " + std::to_string(header.version));
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0 &&
      std::fread(out_record.payload.data(), 1, header.payload_size, file_) != header.payload_size) {
    torn_tail_ = true;
    return false;
  }
  if (header.checksum != checksum32(out_record.payload)) {
    throw std::runtime_error("WAL checksum mismatch at sequence " + std::to_string(header.sequence));
  }

  const long position = std::ftell(file_);
  if (position < 0) {
    throw std::runtime_error("failed to query WAL position");
  }
  valid_end_ = static_cast<std::uintmax_t>(position);
  return true;
}

void Reader::seek_sequence(common::SequenceId sequence) {
  if (!file_) {
    return;
  }
  std::rewind(file_);
  torn_tail_ = false;
  valid_end_ = 0;
  Record record;
  while (true) {
    const long position = std::ftell(file_);
    if (position < 0) {
      throw std::runtime_error("failed to query WAL position");
    }
    if (!next(record)) {
      break;
    }
    if (record.header.sequence >= sequence) {
      if (std::fseek(file_, position, SEEK_SET) != 0) {
        throw std::runtime_error("failed to seek in WAL");
      }
      valid_end_ = static_cast<std::uintmax_t>(position);
      break;
    }
  }
}

void EventJournal::publish(const ledger::Event& event) {
  const auto payload = ledger::encode(event);
  writer_.append(payload);
  ++appended_;
}

}  // namespace wal
}  // namespace stablecore
