#include "test_persistence.hpp"

#include <array>
#include <cassert>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "stablecore/replay/replay_driver.hpp"
#include "stablecore/snapshot/ledger_codec.hpp"
#include "stablecore/snapshot/snapshot_store.hpp"
#include "stablecore/wal/wal_writer.hpp"
#include "test_support.hpp"

namespace stablecore::tests {

namespace fs = std::filesystem;

namespace {

fs::path fresh_dir(const char* name) {
  const auto dir = fs::temp_directory_path() / "stablecore_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::vector<std::byte> int_payload(std::int32_t value) {
  std::vector<std::byte> payload(sizeof(value));
  std::memcpy(payload.data(), &value, sizeof(value));
  return payload;
}

}  // namespace

void test_wal_append_and_read() {
  const auto dir = fresh_dir("wal_append");
  const auto wal_path = dir / "events.wal";

  {
    wal::Writer writer(wal_path, 128);
    assert(writer.next_sequence() == 1);
    assert(writer.append(int_payload(10)) == 1);
    assert(writer.append(int_payload(-5)) == 2);
    assert(writer.append({}) == 3);
    writer.sync();
  }

  wal::Reader reader(wal_path);
  wal::Record record;
  assert(reader.next(record));
  assert(record.header.sequence == 1);
  assert(record.payload == int_payload(10));
  assert(reader.next(record));
  assert(record.header.sequence == 2);
  assert(reader.next(record));
  assert(record.header.sequence == 3);
  assert(record.payload.empty());
  assert(!reader.next(record));

  // Reopening continues the sequence; buffered records reach disk on destruction.
  {
    wal::Writer writer(wal_path, 1 << 16);
    assert(writer.next_sequence() == 4);
    assert(writer.append(int_payload(7)) == 4);
    assert(writer.last_sequence() == 4);
  }

  wal::Reader tail(wal_path);
  tail.seek_sequence(3);
  assert(tail.next(record));
  assert(record.header.sequence == 3);
  assert(tail.next(record));
  assert(record.header.sequence == 4);
  assert(record.payload == int_payload(7));
  assert(!tail.next(record));

  tail.seek_sequence(99);
  assert(!tail.next(record));

  fs::remove_all(dir);
}

void test_wal_rejects_corruption() {
  const auto dir = fresh_dir("wal_corrupt");
  const auto wal_path = dir / "events.wal";
  {
    wal::Writer writer(wal_path, 1);
    writer.append(int_payload(1234));
  }

  // Flip the last payload byte.
  {
    std::fstream file(wal_path, std::ios::binary | std::ios::in | std::ios::out);
    file.seekg(-1, std::ios::end);
    char last = 0;
    file.read(&last, 1);
    last = static_cast<char>(last ^ 0x5a);
    file.seekp(-1, std::ios::end);
    file.write(&last, 1);
  }

  wal::Reader reader(wal_path);
  wal::Record record;
  bool threw = false;
  try {
    reader.next(record);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  // Crash mid-append, part of a header written: the log ends at the last
  // whole record and the writer cuts the junk before appending.
  const auto torn_header_path = dir / "torn_header.wal";
  {
    wal::Writer writer(torn_header_path, 1);
    writer.append(int_payload(1));
    writer.append(int_payload(2));
  }
  const auto whole_size = fs::file_size(torn_header_path);
  {
    std::ofstream junk(torn_header_path, std::ios::binary | std::ios::app);
    junk.write("\x56\x45\x43\x53\x01", 5);
  }
  {
    wal::Reader torn(torn_header_path);
    assert(torn.next(record));
    assert(torn.next(record));
    assert(!torn.next(record));
    assert(torn.torn_tail());
  }
  {
    wal::Writer writer(torn_header_path, 1);
    assert(fs::file_size(torn_header_path) == whole_size);
    assert(writer.append(int_payload(3)) == 3);
  }
  {
    wal::Reader repaired(torn_header_path);
    for (common::SequenceId expected = 1; expected <= 3; ++expected) {
      assert(repaired.next(record));
      assert(record.header.sequence == expected);
    }
    assert(record.payload == int_payload(3));
    assert(!repaired.next(record));
    assert(!repaired.torn_tail());
  }

  // Whole header, payload cut short.
  const auto torn_payload_path = dir / "torn_payload.wal";
  {
    wal::Writer writer(torn_payload_path, 1);
    writer.append(int_payload(1));
    writer.append(int_payload(2));
  }
  fs::resize_file(torn_payload_path, fs::file_size(torn_payload_path) - 2);
  {
    wal::Reader torn(torn_payload_path);
    assert(torn.next(record));
    assert(!torn.next(record));
    assert(torn.torn_tail());
    assert(torn.valid_end() == sizeof(wal::RecordHeader) + sizeof(std::int32_t));
  }
  {
    wal::Writer writer(torn_payload_path, 1);
    assert(writer.next_sequence() == 2);
    assert(writer.append(int_payload(20)) == 2);
  }
  {
    wal::Reader repaired(torn_payload_path);
    assert(repaired.next(record));
    assert(repaired.next(record));
    assert(record.header.sequence == 2);
    assert(record.payload == int_payload(20));
    assert(!repaired.next(record));
    assert(!repaired.torn_tail());
  }

  fs::remove_all(dir);
}

void test_snapshot_ledger_codec() {
  ledger::LedgerState state;
  assert(state.credit(kAlice, kWeth, units(3)) == common::Status::kOk);
  assert(state.credit(kAlice, kWbtc, units(1) / 4) == common::Status::kOk);
  assert(state.increase_debt(kAlice, units(1'500)) == common::Status::kOk);
  assert(state.credit(kBob, kWeth, 1) == common::Status::kOk);

  const auto bytes = snapshot::encode_ledger(state);
  const auto decoded = snapshot::decode_ledger(bytes);
  assert(decoded == state);

  bool threw = false;
  try {
    (void)snapshot::decode_ledger(std::span(bytes).first(bytes.size() - 1));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto padded = bytes;
  padded.push_back(std::byte{0});
  threw = false;
  try {
    (void)snapshot::decode_ledger(padded);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  const auto dir = fresh_dir("snapshot_store");
  snapshot::Store store(dir);
  assert(!store.latest().has_value());
  store.persist(3, ledger::LedgerState{});
  store.persist(8, state);
  auto latest = store.latest();
  assert(latest.has_value());
  assert(latest->sequence == 8);
  assert(latest->ledger == state);
  assert(!fs::exists(fs::path(store.path()).concat(".tmp")));

  // A second store over the same directory sees the image the first one left.
  assert(snapshot::Store(dir).latest()->sequence == 8);

  // A damaged image is reported, never read as an empty ledger.
  {
    std::fstream damaged(store.path(), std::ios::binary | std::ios::in | std::ios::out);
    damaged.seekp(-1, std::ios::end);
    damaged.put('\x7f');
  }
  threw = false;
  try {
    (void)store.latest();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  fs::resize_file(store.path(), 6);
  threw = false;
  try {
    (void)store.latest();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  fs::remove_all(dir);
}

void test_persistence_replay() {
  const auto dir = fresh_dir("replay");
  const auto wal_path = dir / "events.wal";
  const auto snapshot_dir = dir / "snapshots";

  ledger::LedgerState expected;
  {
    wal::Writer writer(wal_path, 64);
    Harness h;
    wal::EventJournal journal(writer);
    h.engine.add_event_sink(journal);
    snapshot::Store snapshots(snapshot_dir);

    assert(h.open(kAlice, units(2), units(1'000)).ok());
    assert(h.open(kBob, units(10), units(2'000)).ok());
    writer.flush();
    snapshots.persist(writer.last_sequence(), h.engine.state());

    assert(h.engine.burn(kAlice, units(400)).ok());
    assert(h.engine.redeem(kAlice, kWeth, units(1) / 2).ok());
    // Rejected operations never reach the log.
    assert(!h.engine.mint(kAlice, units(10'000)).ok());
    assert(h.engine.deposit(3'003, kWeth, units(1)).status == common::Status::kTransferFailed);
    assert(!h.engine.state().has_account(3'003));
    h.set_weth_price(700);
    assert(h.engine.liquidate(kBob, kAlice, kWeth, units(300)).ok());

    assert(journal.appended() == 8);
    writer.sync();
    expected = h.engine.state();
  }

  replay::Driver driver;
  driver.configure(snapshot_dir, wal_path);
  ledger::LedgerState rebuilt;
  const auto stats = replay::recover_ledger(driver, rebuilt);
  assert(stats.snapshot_sequence == 4);
  assert(stats.last_sequence == 8);
  assert(stats.events_applied == 4);

  assert(rebuilt == expected);
  assert(!stats.torn_tail);

  // Without a snapshot the whole log is replayed.
  fs::remove_all(snapshot_dir);
  replay::Driver full;
  full.configure(snapshot_dir, wal_path);
  ledger::LedgerState from_scratch;
  const auto full_stats = replay::recover_ledger(full, from_scratch);
  assert(full_stats.snapshot_sequence == 0);
  assert(full_stats.events_applied == 8);
  assert(from_scratch == expected);

  // A torn final record ends recovery without failing it.
  {
    std::ofstream junk(wal_path, std::ios::binary | std::ios::app);
    junk.write("\x56\x45\x43", 3);
  }
  replay::Driver after_crash;
  after_crash.configure(snapshot_dir, wal_path);
  ledger::LedgerState crashed;
  const auto crash_stats = replay::recover_ledger(after_crash, crashed);
  assert(crash_stats.torn_tail);
  assert(crash_stats.events_applied == 8);
  assert(crashed == expected);

  // A restored engine answers from the recovered ledger.
  Harness restarted;
  assert(restarted.engine.restore(std::move(from_scratch)) == common::Status::kOk);
  assert(restarted.engine.debt_of(kAlice) == expected.debt(kAlice));
  assert(restarted.engine.collateral_balance(kAlice, kWeth) == expected.collateral(kAlice, kWeth));

  fs::remove_all(dir);
}

}  // namespace stablecore::tests
