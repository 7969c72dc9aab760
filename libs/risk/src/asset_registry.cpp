#include "stablecore/risk/asset_registry.hpp"

#include <string>
#include <utility>

#include "stablecore/common/status.hpp"

namespace stablecore {
namespace risk {

AssetRegistry::AssetRegistry(std::vector<common::AssetId> assets, std::vector<oracle::FeedRef> feeds)
    : assets_(std::move(assets)) {
  if (assets_.size() != feeds.size()) {
    throw common::EngineError(common::Status::kConfigurationMismatch,
                              "registry has " + std::to_string(assets_.size()) + " assets but " +
                                  std::to_string(feeds.size()) + " price feeds");
  }

  for (std::size_t i = 0; i < assets_.size(); ++i) {
    auto [it, inserted] = feeds_.try_emplace(assets_[i], feeds[i]);
    if (!inserted) {
      throw common::EngineError(common::Status::kConfigurationMismatch,
                                "asset " + std::to_string(assets_[i]) + " registered twice");
    }
  }
}

bool AssetRegistry::contains(common::AssetId asset) const {
  return feeds_.find(asset) != feeds_.end();
}

std::optional<oracle::FeedRef> AssetRegistry::feed_for(common::AssetId asset) const {
  if (auto it = feeds_.find(asset); it != feeds_.end()) {
    return it->second;
  }
  return std::nullopt;
}

}  // namespace risk
}  // namespace stablecore
