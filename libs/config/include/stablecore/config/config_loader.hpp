#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stablecore {
namespace config {

struct EngineSection {
  std::uint64_t engine_account{0};
};

struct RiskConfig {
  std::int64_t liquidation_threshold{50};
  std::int64_t liquidation_bonus{10};
  std::int64_t min_health_factor{1'000'000'000'000'000'000};
};

struct OracleConfig {
  std::int64_t max_staleness_seconds{3 * 60 * 60};
};

struct RegistryConfig {
  std::vector<std::uint32_t> assets{1, 2};
  std::vector<std::uint32_t> price_feeds{1, 2};
  std::vector<std::int64_t> feed_decimals{8, 8};
  std::vector<std::string> symbols{"WETH", "WBTC"};
};

// Initial answer for one simulated feed, in the feed's own decimals.
struct FeedConfig {
  std::uint32_t id{0};
  std::int64_t answer{0};
};

struct PersistenceConfig {
  std::filesystem::path wal_path{"/var/lib/stablecore/events.wal"};
  std::filesystem::path snapshot_dir{"/var/lib/stablecore/snapshots"};
  std::size_t wal_flush_threshold{128};
  std::size_t snapshot_interval{1000};
};

struct TelemetryConfig {
  bool enabled{true};
};

struct EngineConfig {
  EngineSection engine;
  RiskConfig risk;
  OracleConfig oracle;
  RegistryConfig registry;
  std::vector<FeedConfig> feeds;
  PersistenceConfig persistence;
  TelemetryConfig telemetry;

  [[nodiscard]] std::optional<std::string> symbol_for(std::uint32_t asset) const;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace stablecore
