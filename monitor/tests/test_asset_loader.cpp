#include <catch2/catch_test_macros.hpp>
#include "../src/asset_loader.hpp"
#include "errors.hpp"
#include <cstdio>
#include <fstream>

namespace {

class OfflineFeed : public OracleFeed {
public:
    OfflineFeed(std::string name, std::string url) : name_(std::move(name)), url(std::move(url)) {}

    FeedReading latest() override { throw FeedError(name_ + " offline"); }
    std::string describe() const override { return name_; }

    std::string name_;
    std::string url;
};

struct Bound {
    std::vector<std::string> names;

    FeedFactory factory() {
        return [this](const std::string& erc20, const std::string& slot, const FeedSpec& spec) {
            names.push_back(erc20 + "/" + slot);
            return std::make_shared<OfflineFeed>(erc20 + "/" + slot, spec.url);
        };
    }
};

nlohmann::json fiat_asset() {
    return nlohmann::json::parse(R"({
        "erc20": "cUSDC",
        "target_name": "USD",
        "mode": "fiat",
        "feeds": {"uoa_per_ref": {"url": "http://feeds/usdc", "timeout_s": 86400}},
        "rate_url": "http://rates/cusdc",
        "reward_url": "http://rewards/comp",
        "reward_token": "COMP",
        "reward_recipient": "0xbacker",
        "oracle_error": "0.0025",
        "max_trade_volume": "1000000",
        "default_threshold": "0.0125",
        "delay_until_default_s": 86400,
        "price_timeout_s": 604800,
        "revenue_hiding": "0.000001",
        "balance": "2500.5"
    })");
}

nlohmann::json non_fiat_asset() {
    return nlohmann::json::parse(R"({
        "erc20": "cWBTC",
        "target_name": "BTC",
        "mode": "non_fiat",
        "feeds": {
            "target_per_ref": {"url": "http://feeds/wbtc-btc", "timeout_s": 86400},
            "uoa_per_target": {"url": "http://feeds/btc-usd", "timeout_s": 3600}
        },
        "rate_url": "http://rates/cwbtc",
        "oracle_error": "0.01",
        "max_trade_volume": "50",
        "default_threshold": "0.02",
        "delay_until_default_s": 86400,
        "price_timeout_s": 7200
    })");
}

nlohmann::json book(std::vector<nlohmann::json> assets) {
    nlohmann::json j = {{"liabilities", "1000000"}, {"assets", assets}};
    return j;
}

} // namespace

TEST_CASE("Assets file parsing", "[asset_loader]") {
    Bound bound;

    SECTION("Fiat asset with rewards") {
        auto file = parse_assets(book({fiat_asset()}), bound.factory());
        REQUIRE(file.liabilities == fixmath::from_string("1000000"));
        REQUIRE(file.assets.size() == 1);

        const auto& spec = file.assets[0];
        REQUIRE(spec.config.erc20 == "cUSDC");
        REQUIRE(pricing_mode_name(spec.config.pricing) == "fiat");
        REQUIRE(spec.config.oracle_error == fixmath::from_string("0.0025"));
        REQUIRE(spec.config.default_threshold == fixmath::from_string("0.0125"));
        REQUIRE(spec.config.expected_peg == fixmath::FIX_ONE);
        REQUIRE(spec.config.reward_token == "COMP");
        REQUIRE(spec.revenue_hiding == 1000);
        REQUIRE(spec.balance == fixmath::from_string("2500.5"));
        REQUIRE(spec.rate_url == "http://rates/cusdc");
        REQUIRE(spec.reward_url == "http://rewards/comp");

        auto bindings = feed_bindings(spec.config.pricing);
        REQUIRE(bindings.size() == 1);
        REQUIRE(bindings[0].timeout_s == 86400);
        REQUIRE(bindings[0].feed->describe() == "cUSDC/uoa_per_ref");
    }

    SECTION("Non-fiat asset chains two feeds in order") {
        auto file = parse_assets(book({non_fiat_asset(), fiat_asset()}), bound.factory());
        REQUIRE(file.assets.size() == 2);

        const auto& spec = file.assets[0];
        REQUIRE(pricing_mode_name(spec.config.pricing) == "non_fiat");
        REQUIRE(spec.reward_url.empty());
        REQUIRE(spec.balance == 0);

        auto bindings = feed_bindings(spec.config.pricing);
        REQUIRE(bindings.size() == 2);
        REQUIRE(bindings[0].feed->describe() == "cWBTC/target_per_ref");
        REQUIRE(bindings[1].timeout_s == 3600);
    }

    SECTION("Self-referential asset") {
        auto asset = fiat_asset();
        asset["erc20"] = "cETH";
        asset["mode"] = "self_referential";
        asset["feeds"] = {{"uoa_per_target", {{"url", "http://feeds/eth-usd"}, {"timeout_s", 3600}}}};

        auto file = parse_assets(book({asset}), bound.factory());
        REQUIRE(pricing_mode_name(file.assets[0].config.pricing) == "self_referential");
        REQUIRE(bound.names == std::vector<std::string>{"cETH/uoa_per_target"});
    }

    SECTION("Missing liabilities default to zero") {
        nlohmann::json j = {{"assets", nlohmann::json::array()}};
        auto file = parse_assets(j, bound.factory());
        REQUIRE(file.liabilities == 0);
        REQUIRE(file.assets.empty());
    }
}

TEST_CASE("Assets file rejects bad input", "[asset_loader]") {
    Bound bound;
    auto asset = fiat_asset();

    SECTION("Unknown mode") {
        asset["mode"] = "basket";
        REQUIRE_THROWS_AS(parse_assets(book({asset}), bound.factory()), ConfigInvalid);
    }

    SECTION("Missing feed for the mode") {
        auto wbtc = non_fiat_asset();
        wbtc["feeds"].erase("uoa_per_target");
        REQUIRE_THROWS_AS(parse_assets(book({wbtc}), bound.factory()), ConfigInvalid);
    }

    SECTION("Feed the mode does not use") {
        asset["feeds"]["target_per_ref"] = {{"url", "http://feeds/x"}, {"timeout_s", 60}};
        REQUIRE_THROWS_AS(parse_assets(book({asset}), bound.factory()), ConfigInvalid);
    }

    SECTION("Non-positive feed timeout") {
        asset["feeds"]["uoa_per_ref"]["timeout_s"] = 0;
        REQUIRE_THROWS_AS(parse_assets(book({asset}), bound.factory()), ConfigInvalid);
    }

    SECTION("Decimals must be exact strings") {
        asset["oracle_error"] = 0.0025;
        REQUIRE_THROWS_AS(parse_assets(book({asset}), bound.factory()), ConfigInvalid);

        asset["oracle_error"] = "0.00000000001";
        REQUIRE_THROWS_AS(parse_assets(book({asset}), bound.factory()), ConfigInvalid);
    }

    SECTION("Decimals too large for the fixed-point range") {
        asset["max_trade_volume"] = "99999999999999999999";
        REQUIRE_THROWS_AS(parse_assets(book({asset}), bound.factory()), ConfigInvalid);

        nlohmann::json j = {{"liabilities", "10000000000000"}, {"assets", nlohmann::json::array()}};
        REQUIRE_THROWS_AS(parse_assets(j, bound.factory()), ConfigInvalid);
    }

    SECTION("Parameters out of range") {
        asset["default_threshold"] = "1.5";
        REQUIRE_THROWS_AS(parse_assets(book({asset}), bound.factory()), ConfigInvalid);

        asset = fiat_asset();
        asset["revenue_hiding"] = "1";
        REQUIRE_THROWS_AS(parse_assets(book({asset}), bound.factory()), ConfigInvalid);

        asset = fiat_asset();
        asset["delay_until_default_s"] = 1209601;
        REQUIRE_THROWS_AS(parse_assets(book({asset}), bound.factory()), ConfigInvalid);
    }

    SECTION("Wrong JSON types") {
        asset["erc20"] = 42;
        REQUIRE_THROWS_AS(parse_assets(book({asset}), bound.factory()), ConfigInvalid);

        REQUIRE_THROWS_AS(parse_assets(nlohmann::json::array(), bound.factory()), ConfigInvalid);
    }

    SECTION("Missing rate url") {
        asset.erase("rate_url");
        REQUIRE_THROWS_AS(parse_assets(book({asset}), bound.factory()), ConfigInvalid);
    }

    SECTION("Duplicate assets") {
        REQUIRE_THROWS_AS(parse_assets(book({asset, fiat_asset()}), bound.factory()), ConfigInvalid);
    }
}

TEST_CASE("Assets file on disk", "[asset_loader]") {
    Bound bound;

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(load_assets_file("/nonexistent/assets.json", bound.factory()), ConfigInvalid);
    }

    SECTION("Round trip through a file") {
        std::string path = "pegwatch_test_assets.json";
        {
            std::ofstream out(path);
            out << book({fiat_asset()}).dump(2);
        }
        auto file = load_assets_file(path, bound.factory());
        std::remove(path.c_str());

        REQUIRE(file.assets.size() == 1);
        REQUIRE(file.assets[0].config.erc20 == "cUSDC");
    }

    SECTION("Malformed JSON") {
        std::string path = "pegwatch_test_bad.json";
        {
            std::ofstream out(path);
            out << "{\"assets\": [";
        }
        REQUIRE_THROWS_AS(load_assets_file(path, bound.factory()), ConfigInvalid);
        std::remove(path.c_str());
    }
}
