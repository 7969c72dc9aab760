#include "stablecore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <algorithm>
#include <limits>
#include <set>
#include <sstream>
#include <type_traits>

namespace stablecore {
namespace config {

namespace {

constexpr std::int64_t kDefaultFeedDecimals = 8;
constexpr std::int64_t kMaxFeedDecimals = 18;
constexpr std::int64_t kPercentScale = 100;

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

template <typename T>
bool fits(std::int64_t value) {
  if constexpr (std::is_unsigned_v<T>) {
    return value >= 0 && static_cast<std::uint64_t>(value) <= std::numeric_limits<T>::max();
  } else {
    return value >= std::numeric_limits<T>::min() && value <= std::numeric_limits<T>::max();
  }
}

// Unsigned ids and sizes. A value of the wrong type or out of range for T is
// reported and leaves the default in place.
template <typename T>
T get_uint_or(const toml::table& tbl, std::string_view key, T default_val, const std::string& field,
              std::vector<ValidationError>& errors) {
  const auto node = tbl[key];
  if (!node) {
    return default_val;
  }
  const auto val = node.value_exact<std::int64_t>();
  if (!val || !fits<T>(*val)) {
    errors.push_back({field, "must be an integer in 0.." + std::to_string(std::numeric_limits<T>::max())});
    return default_val;
  }
  return static_cast<T>(*val);
}

template <typename T>
std::vector<T> get_int_array(const toml::table& tbl, std::string_view key, const std::string& field,
                             std::vector<ValidationError>& errors) {
  std::vector<T> values;
  if (auto* arr = tbl[key].as_array()) {
    for (std::size_t i = 0; i < arr->size(); ++i) {
      const auto val = (*arr)[i].value_exact<std::int64_t>();
      if (!val) {
        errors.push_back({field + "[" + std::to_string(i) + "]", "must be an integer"});
      } else if (!fits<T>(*val)) {
        errors.push_back({field + "[" + std::to_string(i) + "]", "out of range"});
      } else {
        values.push_back(static_cast<T>(*val));
      }
    }
  }
  return values;
}

std::vector<std::string> get_str_array(const toml::table& tbl, std::string_view key) {
  std::vector<std::string> values;
  if (auto* arr = tbl[key].as_array()) {
    for (const auto& elem : *arr) {
      if (auto val = elem.value<std::string_view>()) {
        values.emplace_back(*val);
      }
    }
  }
  return values;
}

EngineSection parse_engine(const toml::table& root, std::vector<ValidationError>& errors) {
  EngineSection cfg;
  if (auto* engine = root["engine"].as_table()) {
    cfg.engine_account = get_uint_or(*engine, "engine_account", cfg.engine_account, "engine.engine_account", errors);
  }
  return cfg;
}

RiskConfig parse_risk(const toml::table& root) {
  RiskConfig cfg;
  if (auto* risk = root["risk"].as_table()) {
    cfg.liquidation_threshold = get_int_or(*risk, "liquidation_threshold", cfg.liquidation_threshold);
    cfg.liquidation_bonus = get_int_or(*risk, "liquidation_bonus", cfg.liquidation_bonus);
    cfg.min_health_factor = get_int_or(*risk, "min_health_factor", cfg.min_health_factor);
  }
  return cfg;
}

OracleConfig parse_oracle(const toml::table& root) {
  OracleConfig cfg;
  if (auto* oracle = root["oracle"].as_table()) {
    cfg.max_staleness_seconds = get_int_or(*oracle, "max_staleness_seconds", cfg.max_staleness_seconds);
  }
  return cfg;
}

RegistryConfig parse_registry(const toml::table& root, std::vector<ValidationError>& errors) {
  RegistryConfig cfg;
  auto* registry = root["registry"].as_table();
  if (!registry) {
    return cfg;
  }
  cfg.assets = get_int_array<std::uint32_t>(*registry, "assets", "registry.assets", errors);
  cfg.price_feeds = get_int_array<std::uint32_t>(*registry, "price_feeds", "registry.price_feeds", errors);
  cfg.symbols = get_str_array(*registry, "symbols");
  if ((*registry)["feed_decimals"].as_array()) {
    cfg.feed_decimals = get_int_array<std::int64_t>(*registry, "feed_decimals", "registry.feed_decimals", errors);
  } else {
    cfg.feed_decimals.assign(cfg.price_feeds.size(), kDefaultFeedDecimals);
  }
  return cfg;
}

std::vector<FeedConfig> parse_feeds(const toml::table& root, std::vector<ValidationError>& errors) {
  std::vector<FeedConfig> feeds;
  if (auto* arr = root["feeds"].as_array()) {
    for (const auto& elem : *arr) {
      if (auto* feed_tbl = elem.as_table()) {
        FeedConfig feed;
        feed.id = get_uint_or(*feed_tbl, "id", feed.id, "feeds[" + std::to_string(feeds.size()) + "].id", errors);
        feed.answer = get_int_or(*feed_tbl, "answer", feed.answer);
        feeds.push_back(feed);
      }
    }
  }

  if (feeds.empty() && !root["registry"].as_table()) {
    feeds.push_back(FeedConfig{.id = 1, .answer = 2'000'00000000});
    feeds.push_back(FeedConfig{.id = 2, .answer = 30'000'00000000});
  }

  return feeds;
}

PersistenceConfig parse_persistence(const toml::table& root, std::vector<ValidationError>& errors) {
  PersistenceConfig cfg;
  if (auto* persistence = root["persistence"].as_table()) {
    cfg.wal_path = get_str_or(*persistence, "wal_path", cfg.wal_path.string());
    cfg.snapshot_dir = get_str_or(*persistence, "snapshot_dir", cfg.snapshot_dir.string());
    cfg.wal_flush_threshold = get_uint_or(*persistence, "wal_flush_threshold", cfg.wal_flush_threshold,
                                          "persistence.wal_flush_threshold", errors);
    cfg.snapshot_interval = get_uint_or(*persistence, "snapshot_interval", cfg.snapshot_interval,
                                        "persistence.snapshot_interval", errors);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    if (auto val = (*telemetry)["enabled"].value<bool>()) {
      cfg.enabled = *val;
    }
  }
  return cfg;
}

EngineConfig parse_config(const toml::table& root, std::vector<ValidationError>& errors) {
  EngineConfig cfg;
  cfg.engine = parse_engine(root, errors);
  cfg.risk = parse_risk(root);
  cfg.oracle = parse_oracle(root);
  cfg.registry = parse_registry(root, errors);
  cfg.feeds = parse_feeds(root, errors);
  cfg.persistence = parse_persistence(root, errors);
  cfg.telemetry = parse_telemetry(root);
  return cfg;
}

template <typename Parsed>
LoadResult finish(Parsed& parse_result) {
  LoadResult result;
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  // Values that could not be read come first, then the checks on what was read.
  result.config = parse_config(parse_result.table(), result.errors);
  auto checks = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.end(), checks.begin(), checks.end());
  result.success = result.errors.empty();
  return result;
}

}  // namespace

std::optional<std::string> EngineConfig::symbol_for(std::uint32_t asset) const {
  for (std::size_t i = 0; i < registry.assets.size() && i < registry.symbols.size(); ++i) {
    if (registry.assets[i] == asset) {
      return registry.symbols[i];
    }
  }
  return std::nullopt;
}

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  return finish(parse_result);
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  auto parse_result = toml::parse(toml_content);
  return finish(parse_result);
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.risk.liquidation_threshold <= 0 || config.risk.liquidation_threshold > kPercentScale) {
    errors.push_back({"risk.liquidation_threshold", "must be in 1..100"});
  }

  if (config.risk.liquidation_bonus < 0 || config.risk.liquidation_bonus > kPercentScale) {
    errors.push_back({"risk.liquidation_bonus", "must be in 0..100"});
  }

  if (config.risk.min_health_factor <= 0) {
    errors.push_back({"risk.min_health_factor", "must be positive"});
  }

  if (config.oracle.max_staleness_seconds < 0) {
    errors.push_back({"oracle.max_staleness_seconds", "must be >= 0 (0 disables the check)"});
  }

  const auto& registry = config.registry;
  if (registry.assets.empty()) {
    errors.push_back({"registry.assets", "at least one collateral asset is required"});
  }

  if (registry.assets.size() != registry.price_feeds.size()) {
    errors.push_back({"registry.price_feeds", "must have one feed per asset"});
  }

  if (registry.feed_decimals.size() != registry.price_feeds.size()) {
    errors.push_back({"registry.feed_decimals", "must have one entry per feed"});
  }

  if (!registry.symbols.empty() && registry.symbols.size() != registry.assets.size()) {
    errors.push_back({"registry.symbols", "must be empty or have one symbol per asset"});
  }

  std::set<std::uint32_t> seen;
  for (std::size_t i = 0; i < registry.assets.size(); ++i) {
    if (!seen.insert(registry.assets[i]).second) {
      errors.push_back({"registry.assets[" + std::to_string(i) + "]", "duplicate asset"});
    }
  }

  for (std::size_t i = 0; i < registry.feed_decimals.size(); ++i) {
    const auto decimals = registry.feed_decimals[i];
    if (decimals < 0 || decimals > kMaxFeedDecimals) {
      errors.push_back({"registry.feed_decimals[" + std::to_string(i) + "]", "must be in 0..18"});
    }
  }

  for (std::size_t i = 0; i < config.feeds.size(); ++i) {
    const auto& feed = config.feeds[i];
    std::string prefix = "feeds[" + std::to_string(i) + "]";

    if (std::find(registry.price_feeds.begin(), registry.price_feeds.end(), feed.id) == registry.price_feeds.end()) {
      errors.push_back({prefix + ".id", "feed is not referenced by the registry"});
    }

    if (feed.answer <= 0) {
      errors.push_back({prefix + ".answer", "must be positive"});
    }
  }

  if (config.persistence.wal_path.empty()) {
    errors.push_back({"persistence.wal_path", "wal_path cannot be empty"});
  }

  if (config.persistence.snapshot_dir.empty()) {
    errors.push_back({"persistence.snapshot_dir", "snapshot_dir cannot be empty"});
  }

  if (config.persistence.wal_flush_threshold == 0) {
    errors.push_back({"persistence.wal_flush_threshold", "must be greater than 0"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# StableCore Engine Configuration
# Generated default configuration

[engine]
engine_account = 0

[risk]
liquidation_threshold = 50               # percent of collateral value counted
liquidation_bonus = 10                   # percent paid on top of seized collateral
min_health_factor = 1000000000000000000  # 1.0 at 18 decimals

[oracle]
max_staleness_seconds = 10800  # 3h, 0 disables

[registry]
assets = [1, 2]
price_feeds = [1, 2]
feed_decimals = [8, 8]
symbols = ["WETH", "WBTC"]

[[feeds]]
id = 1
answer = 200000000000   # $2,000

[[feeds]]
id = 2
answer = 3000000000000  # $30,000

[persistence]
wal_path = "/var/lib/stablecore/events.wal"
snapshot_dir = "/var/lib/stablecore/snapshots"
wal_flush_threshold = 128
snapshot_interval = 1000

[telemetry]
enabled = true
)";
}

}  // namespace config
}  // namespace stablecore
