#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stablecore/auth/authenticator.hpp"
#include "stablecore/common/fixed_point.hpp"
#include "stablecore/common/status.hpp"
#include "stablecore/common/time_utils.hpp"
#include "stablecore/config/config_loader.hpp"
#include "stablecore/engine/collateral_engine.hpp"
#include "stablecore/engine/in_memory_collaborators.hpp"
#include "stablecore/engine/metrics.hpp"
#include "stablecore/engine/operation_request.hpp"
#include "stablecore/oracle/static_price_feed.hpp"
#include "stablecore/replay/replay_driver.hpp"
#include "stablecore/snapshot/snapshot_store.hpp"
#include "stablecore/telemetry/telemetry_sink.hpp"
#include "stablecore/wal/wal_writer.hpp"

namespace {

using namespace stablecore;

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file] [script_file]\n"
            << "  config_file: Path to TOML configuration file, or '-' to search the default locations\n"
            << "               (./stablecore.toml, /etc/stablecore/stablecore.toml,\n"
            << "               ~/.config/stablecore/stablecore.toml) and fall back to generated defaults\n"
            << "  script_file: Command script; reads stdin when omitted\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1 && std::string_view{argv[1]} != "-") {
    return std::filesystem::path{argv[1]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./stablecore.toml",
      "/etc/stablecore/stablecore.toml",
      std::filesystem::path{home ? home : ""} / ".config/stablecore/stablecore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

std::optional<config::EngineConfig> load_config(const std::filesystem::path& config_path) {
  config::LoadResult result;
  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    result = config::ConfigLoader::load(config_path);
  }

  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return std::nullopt;
  }
  return std::move(result.config);
}

std::vector<std::string_view> words_of(std::string_view line) {
  std::vector<std::string_view> words;
  std::size_t pos = 0;
  while (pos < line.size()) {
    pos = line.find_first_not_of(" \t", pos);
    if (pos == std::string_view::npos) {
      break;
    }
    const auto end = line.find_first_of(" \t", pos);
    words.push_back(line.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos));
    pos = end;
  }
  return words;
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
  T value{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

// Script-side signer: one generated keypair and nonce counter per account.
class KeyRing {
 public:
  explicit KeyRing(auth::Authenticator& authenticator) : authenticator_(authenticator) {}

  std::optional<auth::SignedRequest> sign(engine::OperationRequest request) {
    auto it = keys_.find(request.account);
    if (it == keys_.end()) {
      Entry entry;
      auth::PublicKey public_key;
      auth::Authenticator::generate_keypair(public_key, entry.secret);
      authenticator_.register_account(request.account, public_key);
      it = keys_.emplace(request.account, entry).first;
    }
    request.nonce = ++it->second.nonce;
    return auth::sign_request(it->second.secret, request);
  }

 private:
  struct Entry {
    auth::SecretKey secret{};
    std::uint64_t nonce{0};
  };

  auth::Authenticator& authenticator_;
  std::map<common::AccountId, Entry> keys_{};
};

class ScriptRunner {
 public:
  ScriptRunner(const config::EngineConfig& cfg,
               engine::CollateralEngine& engine,
               oracle::StaticPriceFeed& feed,
               engine::InMemoryCustody& custody,
               wal::Writer& wal,
               snapshot::Store& snapshots,
               auth::Authenticator& authenticator)
      : cfg_(cfg),
        engine_(engine),
        feed_(feed),
        custody_(custody),
        wal_(wal),
        snapshots_(snapshots),
        keys_(authenticator),
        verifier_(authenticator) {}

  void run(std::istream& in) {
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
      ++line_number;
      std::string_view view{line};
      if (auto hash = view.find('#'); hash != std::string_view::npos) {
        view = view.substr(0, hash);
      }
      const auto words = words_of(view);
      if (words.empty()) {
        continue;
      }
      if (!execute(view, words)) {
        std::cerr << "line " << line_number << ": cannot parse '" << line << "'\n";
        ++rejected_;
      }
    }
  }

  [[nodiscard]] std::size_t rejected() const noexcept { return rejected_; }

  void take_snapshot() {
    wal_.sync();
    const auto sequence = wal_.last_sequence();
    snapshots_.persist(sequence, engine_.state());
    std::cout << "snapshot at sequence " << sequence << " (" << engine_.state().accounts().size()
              << " accounts)\n";
  }

 private:
  bool execute(std::string_view line, const std::vector<std::string_view>& words) {
    const auto command = words[0];
    if (command == "fund" && words.size() == 4) {
      auto asset = parse_number<common::AssetId>(words[1]);
      auto holder = parse_number<common::AccountId>(words[2]);
      auto amount = common::parse_amount(words[3]);
      if (!asset || !holder || !amount || *amount <= 0) {
        return false;
      }
      custody_.fund(*asset, *holder, *amount);
      std::cout << "fund asset=" << *asset << " holder=" << *holder << " amount=" << common::to_string(*amount)
                << "\n";
      return true;
    }
    if (command == "price" && (words.size() == 3 || words.size() == 4)) {
      auto id = parse_number<common::FeedId>(words[1]);
      auto answer = parse_number<std::int64_t>(words[2]);
      auto updated_at = words.size() == 4 ? parse_number<common::TimestampS>(words[3])
                                          : std::optional<common::TimestampS>{common::now_unix_seconds()};
      if (!id || !answer || !updated_at) {
        return false;
      }
      feed_.set_price(*id, *answer, *updated_at);
      std::cout << "price feed=" << *id << " answer=" << *answer << " updated_at=" << *updated_at << "\n";
      return true;
    }
    if (command == "summary" && words.size() == 2) {
      auto account = parse_number<common::AccountId>(words[1]);
      if (!account) {
        return false;
      }
      print_summary(*account);
      return true;
    }
    if (command == "snapshot" && words.size() == 1) {
      take_snapshot();
      return true;
    }

    auto request = engine::parse_command(line);
    if (!request) {
      return false;
    }
    submit(*request);
    return true;
  }

  void submit(const engine::OperationRequest& request) {
    auto signed_request = keys_.sign(request);
    if (!signed_request) {
      std::cerr << engine::to_string(request.op) << ": signing failed\n";
      return;
    }
    const auto auth_status = verifier_.verify(*signed_request);
    if (auth_status != auth::AuthStatus::kAccepted) {
      std::cerr << engine::to_string(request.op) << ": rejected by auth: " << auth::to_string(auth_status) << "\n";
      return;
    }

    const auto result = engine::dispatch(engine_, signed_request->request);
    std::cout << engine::to_string(request.op) << " account=" << request.account << " -> "
              << common::to_string(result.status);
    if (result.status == common::Status::kBreaksHealthFactor) {
      std::cout << " health_factor=" << common::format_fixed(result.health_factor);
    }
    std::cout << "\n";

    if (result.ok() && cfg_.persistence.snapshot_interval > 0 &&
        ++operations_since_snapshot_ >= cfg_.persistence.snapshot_interval) {
      take_snapshot();
      operations_since_snapshot_ = 0;
    }
  }

  void print_summary(common::AccountId account) {
    const auto summary = engine_.account_summary(account);
    std::cout << "summary account=" << account << " debt=" << common::format_fixed(engine_.debt_of(account));
    for (auto asset : engine_.collateral_assets()) {
      const auto balance = engine_.collateral_balance(account, asset);
      if (balance == 0) {
        continue;
      }
      std::cout << " " << cfg_.symbol_for(asset).value_or("asset" + std::to_string(asset)) << "="
                << common::format_fixed(balance);
    }
    if (!summary.ok()) {
      std::cout << " valuation=" << common::to_string(summary.status) << "\n";
      return;
    }
    std::cout << " collateral_usd=" << common::format_fixed(summary.collateral_value);
    const auto health = engine_.health_factor(account);
    if (health.ok() && health.value == common::kMaxAmount) {
      std::cout << " health_factor=max";
    } else if (health.ok()) {
      std::cout << " health_factor=" << common::format_fixed(health.value);
    }
    std::cout << "\n";
  }

  const config::EngineConfig& cfg_;
  engine::CollateralEngine& engine_;
  oracle::StaticPriceFeed& feed_;
  engine::InMemoryCustody& custody_;
  wal::Writer& wal_;
  snapshot::Store& snapshots_;
  KeyRing keys_;
  auth::RequestAuthenticator verifier_;
  std::size_t operations_since_snapshot_{0};
  std::size_t rejected_{0};
};

void print_telemetry(telemetry::TelemetrySink& telemetry) {
  std::cout << "Telemetry:\n";
  for (const auto& [id, value] : telemetry.counters()) {
    std::cout << "  " << engine::metric_name(id);
    if (id > engine::kFailureOffset) {
      std::cout << "[" << engine::metric_name(static_cast<telemetry::MetricId>(id - engine::kFailureOffset)) << "]";
    }
    std::cout << " = " << value << "\n";
  }
  for (const auto& report : telemetry.take_latency_reports()) {
    std::cout << "  latency " << engine::metric_name(report.id) << ": n=" << report.count
              << " avg=" << report.average.count() << "ns p50<=" << report.p50.count() << "ns p99<="
              << report.p99.count() << "ns max=" << report.longest.count() << "ns\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace stablecore;

  if (argc > 3) {
    print_usage(argv[0]);
    return 1;
  }

  auto loaded = load_config(find_config_path(argc, argv));
  if (!loaded) {
    return 1;
  }
  const config::EngineConfig cfg = std::move(*loaded);

  std::cout << "Config loaded successfully\n";
  std::cout << "  Collateral assets: " << cfg.registry.assets.size() << "\n";
  std::cout << "  WAL path: " << cfg.persistence.wal_path << "\n";

  oracle::StaticPriceFeed feed;
  const auto now = common::now_unix_seconds();
  for (const auto& initial : cfg.feeds) {
    feed.set_price(initial.id, initial.answer, now);
  }

  engine::InMemoryCustody custody{cfg.engine.engine_account};
  engine::InMemoryDebtToken debt_token;
  telemetry::TelemetrySink telemetry;

  std::vector<oracle::FeedRef> feeds;
  for (std::size_t i = 0; i < cfg.registry.price_feeds.size(); ++i) {
    feeds.push_back({.id = cfg.registry.price_feeds[i],
                     .decimals = static_cast<std::uint8_t>(cfg.registry.feed_decimals[i])});
  }

  engine::EngineOptions options;
  options.parameters = {
      .liquidation_threshold = cfg.risk.liquidation_threshold,
      .liquidation_bonus = cfg.risk.liquidation_bonus,
      .min_health_factor = cfg.risk.min_health_factor,
  };
  options.engine_account = cfg.engine.engine_account;
  options.max_price_staleness_s = cfg.oracle.max_staleness_seconds;
  options.telemetry = cfg.telemetry.enabled ? &telemetry : nullptr;

  std::optional<engine::CollateralEngine> core;
  try {
    core.emplace(cfg.registry.assets, feeds, feed, custody, debt_token, options);
  } catch (const common::EngineError& e) {
    std::cerr << "Engine configuration rejected: " << e.what() << "\n";
    return 1;
  }

  try {
    std::filesystem::create_directories(cfg.persistence.snapshot_dir);
    if (cfg.persistence.wal_path.has_parent_path()) {
      std::filesystem::create_directories(cfg.persistence.wal_path.parent_path());
    }

    replay::Driver replay;
    replay.configure(cfg.persistence.snapshot_dir, cfg.persistence.wal_path);
    ledger::LedgerState recovered;
    const auto stats = replay::recover_ledger(replay, recovered);
    const auto restored = core->restore(std::move(recovered));
    if (restored != common::Status::kOk) {
      std::cerr << "Restore failed: " << common::to_string(restored) << "\n";
      return 1;
    }
    std::cout << "Recovered ledger: snapshot sequence " << stats.snapshot_sequence << ", " << stats.events_applied
              << " WAL events, last sequence " << stats.last_sequence << "\n";
    if (stats.torn_tail) {
      std::cout << "WAL ends in a torn record; it will be discarded\n";
    }

    wal::Writer wal{cfg.persistence.wal_path, cfg.persistence.wal_flush_threshold};
    wal::EventJournal wal_sink{wal};
    core->add_event_sink(wal_sink);
    snapshot::Store snapshots{cfg.persistence.snapshot_dir};

    auth::Authenticator authenticator;
    ScriptRunner runner{cfg, *core, feed, custody, wal, snapshots, authenticator};

    std::cout << "stablecored bootstrapped successfully\n";

    if (argc > 2) {
      std::ifstream script{argv[2]};
      if (!script) {
        std::cerr << "Cannot open script: " << argv[2] << "\n";
        return 1;
      }
      runner.run(script);
    } else {
      runner.run(std::cin);
    }

    wal.sync();
    std::cout << "Processed script: " << wal_sink.appended() << " events written, " << runner.rejected()
              << " unparsed lines, debt token supply " << common::format_fixed(debt_token.total_supply()) << "\n";
  } catch (const std::runtime_error& e) {
    std::cerr << "Persistence failure: " << e.what() << "\n";
    return 1;
  }

  if (cfg.telemetry.enabled) {
    print_telemetry(telemetry);
  }
  return 0;
}
