#pragma once

#include "../src/collateral.hpp"
#include "../src/errors.hpp"
#include "../src/events.hpp"
#include "../src/feeds.hpp"
#include <memory>
#include <string>
#include <vector>

class ManualClock : public Clock {
public:
    int64_t now = 0;

    int64_t now_s() const override { return now; }
    void advance(int64_t seconds) { now += seconds; }
};

class StubFeed : public OracleFeed {
public:
    StubFeed(std::string name, Fix price, int64_t updated_at = 0)
        : name_(std::move(name)), price(price), updated_at(updated_at) {}

    FeedReading latest() override {
        if (fail) throw FeedError(name_ + " reverted");
        return FeedReading{price, updated_at};
    }
    std::string describe() const override { return name_; }

    std::string name_;
    Fix price;
    int64_t updated_at;
    bool fail = false;
};

class StubRateSource : public ExchangeRateSource {
public:
    explicit StubRateSource(Fix rate) : rate(rate) {}

    Fix current_rate() override {
        if (fail) throw FeedError("rate source reverted");
        return rate;
    }

    Fix rate;
    bool fail = false;
};

class StubRewardSource : public RewardSource {
public:
    explicit StubRewardSource(Fix pending) : pending(pending) {}

    Fix claim(const std::string& recipient) override {
        if (fail) throw FeedError("claim reverted");
        recipients.push_back(recipient);
        Fix amount = pending;
        pending = 0;
        return amount;
    }

    Fix pending;
    bool fail = false;
    std::vector<std::string> recipients;
};

class RecordingSink : public EventSink {
public:
    void on_status_changed(const StatusChanged& event) override { status_changes.push_back(event); }
    void on_rewards_claimed(const RewardsClaimed& event) override { claims.push_back(event); }

    std::vector<StatusChanged> status_changes;
    std::vector<RewardsClaimed> claims;
};

inline Fix fp(const std::string& decimal) {
    return fixmath::from_string(decimal);
}

// 0.5% oracle error, 1% default threshold, one day grace, one week price timeout
inline CollateralConfig base_config(const std::string& erc20, PricingMode pricing) {
    CollateralConfig config;
    config.erc20 = erc20;
    config.target_name = "USD";
    config.pricing = std::move(pricing);
    config.oracle_error = fp("0.005");
    config.max_trade_volume = fp("1000000");
    config.default_threshold = fp("0.01");
    config.delay_until_default_s = 86400;
    config.price_timeout_s = 604800;
    config.reward_recipient = "0xbacker";
    return config;
}
