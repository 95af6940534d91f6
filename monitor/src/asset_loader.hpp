#pragma once

#include "collateral_config.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct FeedSpec {
    std::string url;
    int64_t timeout_s = 0;
};

// One entry of the assets file, with its feeds already bound
struct AssetSpec {
    CollateralConfig config;
    Fix revenue_hiding = 0;
    Fix balance = 0;

    std::map<std::string, FeedSpec> feeds;
    std::string rate_url;
    std::string reward_url;
};

struct AssetsFile {
    Fix liabilities = 0;
    std::vector<AssetSpec> assets;
};

// Builds the oracle feed for a named feed slot of an asset
using FeedFactory = std::function<std::shared_ptr<OracleFeed>(
    const std::string& erc20, const std::string& slot, const FeedSpec& spec)>;

// Feed slots required by a pricing mode name, in chain order. Empty for an
// unknown mode.
std::vector<std::string> feed_slots(const std::string& mode);

// Throws ConfigInvalid on malformed or inconsistent input
AssetsFile parse_assets(const nlohmann::json& j, const FeedFactory& make_feed);
AssetsFile load_assets_file(const std::string& path, const FeedFactory& make_feed);
