#include "asset_loader.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <spdlog/spdlog.h>

namespace {

Fix decimal_field(const nlohmann::json& j, const char* key, const std::string& default_val = "") {
    if (!j.contains(key) || j[key].is_null()) {
        if (default_val.empty()) {
            throw ConfigInvalid(std::string(key) + " is required");
        }
        return fixmath::from_string(default_val);
    }
    if (!j[key].is_string()) {
        throw ConfigInvalid(std::string(key) + " must be a decimal string");
    }
    try {
        return fixmath::from_string(j[key].get<std::string>());
    } catch (const std::exception& e) {
        // Malformed or out of range
        throw ConfigInvalid(std::string(key) + ": " + e.what());
    }
}

int64_t seconds_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number_integer()) {
        throw ConfigInvalid(std::string(key) + " must be an integer number of seconds");
    }
    return j[key].get<int64_t>();
}

FeedBinding bind_feed(const AssetSpec& spec, const std::string& slot, const FeedFactory& make_feed) {
    auto it = spec.feeds.find(slot);
    if (it == spec.feeds.end()) {
        throw ConfigInvalid(spec.config.erc20 + ": missing feed " + slot);
    }
    return FeedBinding{make_feed(spec.config.erc20, slot, it->second), it->second.timeout_s};
}

PricingMode make_pricing(const std::string& mode, const AssetSpec& spec, const FeedFactory& make_feed) {
    if (mode == "fiat") {
        return FiatPegged{bind_feed(spec, "uoa_per_ref", make_feed)};
    }
    if (mode == "self_referential") {
        return SelfReferential{bind_feed(spec, "uoa_per_target", make_feed)};
    }
    if (mode == "non_fiat") {
        return NonFiat{bind_feed(spec, "target_per_ref", make_feed),
                       bind_feed(spec, "uoa_per_target", make_feed)};
    }
    throw ConfigInvalid(spec.config.erc20 + ": unknown mode " + mode);
}

AssetSpec parse_asset(const nlohmann::json& a, const FeedFactory& make_feed) {
    if (!a.is_object()) {
        throw ConfigInvalid("asset entry must be an object");
    }

    AssetSpec spec;
    spec.config.erc20 = a.value("erc20", "");
    spec.config.target_name = a.value("target_name", "");
    if (spec.config.erc20.empty()) {
        throw ConfigInvalid("erc20 is required");
    }

    if (a.contains("feeds")) {
        if (!a["feeds"].is_object()) {
            throw ConfigInvalid(spec.config.erc20 + ": feeds must be an object");
        }
        for (const auto& [slot, feed] : a["feeds"].items()) {
            FeedSpec fs;
            fs.url = feed.value("url", "");
            fs.timeout_s = seconds_field(feed, "timeout_s");
            if (fs.url.empty()) {
                throw ConfigInvalid(spec.config.erc20 + ": feed " + slot + " needs a url");
            }
            spec.feeds.emplace(slot, fs);
        }
    }

    spec.rate_url = a.value("rate_url", "");
    if (spec.rate_url.empty()) {
        throw ConfigInvalid(spec.config.erc20 + ": rate_url is required");
    }
    spec.reward_url = a.value("reward_url", "");
    spec.config.reward_token = a.value("reward_token", "");
    spec.config.reward_recipient = a.value("reward_recipient", "");

    spec.config.oracle_error = decimal_field(a, "oracle_error");
    spec.config.max_trade_volume = decimal_field(a, "max_trade_volume");
    spec.config.default_threshold = decimal_field(a, "default_threshold");
    spec.config.delay_until_default_s = seconds_field(a, "delay_until_default_s");
    spec.config.price_timeout_s = seconds_field(a, "price_timeout_s");
    spec.config.expected_peg = decimal_field(a, "expected_peg", "1");
    spec.revenue_hiding = decimal_field(a, "revenue_hiding", "0");
    spec.balance = decimal_field(a, "balance", "0");

    if (spec.revenue_hiding < 0 || spec.revenue_hiding >= fixmath::FIX_ONE) {
        throw ConfigInvalid(spec.config.erc20 + ": revenue_hiding must be in [0, 1)");
    }
    if (spec.balance < 0) {
        throw ConfigInvalid(spec.config.erc20 + ": balance must not be negative");
    }

    std::string mode = a.value("mode", "");
    auto slots = feed_slots(mode);
    if (slots.empty()) {
        throw ConfigInvalid(spec.config.erc20 + ": unknown mode " + mode);
    }
    for (const auto& [slot, fs] : spec.feeds) {
        if (std::find(slots.begin(), slots.end(), slot) == slots.end()) {
            throw ConfigInvalid(spec.config.erc20 + ": feed " + slot + " is not used by mode " + mode);
        }
    }

    spec.config.pricing = make_pricing(mode, spec, make_feed);
    spec.config.validate();
    return spec;
}

} // namespace

std::vector<std::string> feed_slots(const std::string& mode) {
    if (mode == "fiat") return {"uoa_per_ref"};
    if (mode == "self_referential") return {"uoa_per_target"};
    if (mode == "non_fiat") return {"target_per_ref", "uoa_per_target"};
    return {};
}

AssetsFile parse_assets(const nlohmann::json& j, const FeedFactory& make_feed) {
    if (!j.is_object() || !j.contains("assets") || !j["assets"].is_array()) {
        throw ConfigInvalid("assets file needs an assets array");
    }

    AssetsFile file;
    file.liabilities = decimal_field(j, "liabilities", "0");
    if (file.liabilities < 0) {
        throw ConfigInvalid("liabilities must not be negative");
    }

    std::set<std::string> seen;
    for (size_t i = 0; i < j["assets"].size(); ++i) {
        AssetSpec spec;
        try {
            spec = parse_asset(j["assets"][i], make_feed);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigInvalid("asset #" + std::to_string(i) + ": " + e.what());
        }

        if (!seen.insert(spec.config.erc20).second) {
            throw ConfigInvalid("duplicate asset " + spec.config.erc20);
        }
        file.assets.push_back(std::move(spec));
    }

    spdlog::info("Loaded {} assets, liabilities {}", file.assets.size(),
                 fixmath::to_string(file.liabilities));
    return file;
}

AssetsFile load_assets_file(const std::string& path, const FeedFactory& make_feed) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigInvalid("cannot open assets file " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigInvalid(path + ": " + e.what());
    }
    return parse_assets(j, make_feed);
}
