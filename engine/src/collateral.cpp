#include "collateral.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

using fixmath::Rounding;

namespace {

CollateralConfig validated(CollateralConfig config) {
    config.validate();
    return config;
}

Fix checked_hiding(Fix revenue_hiding) {
    if (revenue_hiding < 0 || revenue_hiding >= fixmath::FIX_ONE) {
        throw ConfigInvalid("revenue hiding out of range");
    }
    return revenue_hiding;
}

std::shared_ptr<Clock> checked_clock(std::shared_ptr<Clock> clock) {
    if (!clock) {
        throw ConfigInvalid("clock missing");
    }
    return clock;
}

nlohmann::json optional_ts(const std::optional<int64_t>& ts) {
    return ts ? nlohmann::json(*ts) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json snapshot_to_json(const CollateralSnapshot& snapshot) {
    nlohmann::json j = {
        {"erc20", snapshot.erc20},
        {"status", status_name(snapshot.status)},
        {"iffy_since", optional_ts(snapshot.iffy_since)},
        {"peak_rate", fixmath::to_string(snapshot.peak_rate)},
        {"exposed_rate", fixmath::to_string(snapshot.exposed_rate)},
        {"last_save", snapshot.last_save},
        {"taken_at", snapshot.taken_at},
        {"feed_updates", snapshot.feed_updates},
        {"last_rate_at", optional_ts(snapshot.last_rate_at)}
    };
    if (snapshot.saved_price) {
        j["saved_low"] = fixmath::to_string(snapshot.saved_price->low);
        j["saved_high"] = fixmath::to_string(snapshot.saved_price->high);
    } else {
        j["saved_low"] = nullptr;
        j["saved_high"] = nullptr;
    }
    return j;
}

CollateralSnapshot snapshot_from_json(const nlohmann::json& j) {
    CollateralSnapshot snapshot;
    snapshot.erc20 = j.at("erc20").get<std::string>();

    auto status = status_from_name(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown status: " + j.at("status").get<std::string>());
    }
    snapshot.status = *status;

    if (j.contains("iffy_since") && !j["iffy_since"].is_null()) {
        snapshot.iffy_since = j["iffy_since"].get<int64_t>();
    }
    snapshot.peak_rate = fixmath::from_string(j.at("peak_rate").get<std::string>());
    snapshot.exposed_rate = fixmath::from_string(j.at("exposed_rate").get<std::string>());
    snapshot.last_save = j.value("last_save", int64_t{0});
    snapshot.taken_at = j.value("taken_at", int64_t{0});
    if (j.contains("feed_updates") && !j["feed_updates"].is_null()) {
        snapshot.feed_updates = j["feed_updates"].get<std::vector<int64_t>>();
    }
    if (j.contains("last_rate_at") && !j["last_rate_at"].is_null()) {
        snapshot.last_rate_at = j["last_rate_at"].get<int64_t>();
    }

    if (j.contains("saved_low") && !j["saved_low"].is_null() &&
        j.contains("saved_high") && !j["saved_high"].is_null()) {
        snapshot.saved_price = PriceRange{
            fixmath::from_string(j["saved_low"].get<std::string>()),
            fixmath::from_string(j["saved_high"].get<std::string>())
        };
    }
    return snapshot;
}

Collateral::Collateral(CollateralConfig config,
                       Fix revenue_hiding,
                       std::shared_ptr<ExchangeRateSource> rate_source,
                       std::shared_ptr<Clock> clock,
                       std::shared_ptr<EventSink> events,
                       std::shared_ptr<RewardSource> rewards)
    : config_(validated(std::move(config)))
    , rate_source_(std::move(rate_source))
    , clock_(checked_clock(std::move(clock)))
    , events_(std::move(events))
    , rewards_(std::move(rewards))
    , tracker_(checked_hiding(revenue_hiding))
    , pricer_(config_.pricing, config_.oracle_error, config_.price_timeout_s,
              config_.expected_peg, clock_->now_s())
    , monitor_(MonitorParams{config_.default_threshold, config_.expected_peg,
                             config_.delay_until_default_s, config_.price_timeout_s})
    , last_rate_at_(clock_->now_s())
{
    if (!rate_source_) {
        throw ConfigInvalid("exchange rate source missing");
    }

    spdlog::info("Collateral {} created: mode={}, target={}, revenue hiding={}",
                 config_.erc20, pricing_mode_name(config_.pricing), config_.target_name,
                 fixmath::to_string(revenue_hiding));
}

CollateralStatus Collateral::refresh() {
    std::optional<StatusChanged> change;
    CollateralStatus current;

    std::optional<Fix> raw_rate;
    try {
        Fix rate = rate_source_->current_rate();
        if (rate < 0) {
            spdlog::warn("{}: exchange rate source reported negative rate {}",
                         config_.erc20, fixmath::to_string(rate));
        } else {
            raw_rate = rate;
        }
    } catch (const std::exception& e) {
        spdlog::warn("{}: exchange rate read failed: {}", config_.erc20, e.what());
    }
    std::vector<FeedRead> reads = pricer_.read_feeds();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_->now_s();

        rate_ok_ = false;
        if (raw_rate) {
            tracker_.update(*raw_rate);
            rate_ok_ = true;
            last_rate_at_ = now;
        }

        pricer_.apply(reads, now);

        MonitorSignals signals;
        signals.promise_broken = rate_ok_ && tracker_.promise_broken();

        PriceResult result = price_locked(now);
        if (const auto* estimate = std::get_if<PriceEstimate>(&result)) {
            signals.priced = true;
            signals.peg_price = estimate->peg_price;
            saved_price_ = PriceRange{estimate->low, estimate->high};
            last_save_ = now;
        } else {
            const auto& unpriced = std::get<Unpriceable>(result);
            signals.price_unknown_too_long =
                unpriced.reason == UnpriceableReason::PriceUnknownTooLong;
            signals.staleness_s = unpriced.staleness_s;
            spdlog::debug("{}: unpriceable ({}): {}", config_.erc20,
                          reason_name(unpriced.reason), unpriced.detail);
        }

        if (auto transition = monitor_.evaluate(signals, now)) {
            change = StatusChanged{config_.erc20, transition->from, transition->to, transition->at};
            spdlog::warn("{}: status {} -> {}", config_.erc20,
                         status_name(transition->from), status_name(transition->to));
        }

        refreshed_ = true;
        current = monitor_.status();
    }

    if (change && events_) {
        try {
            events_->on_status_changed(*change);
        } catch (const std::exception& e) {
            spdlog::error("{}: failed to publish status change: {}", config_.erc20, e.what());
        }
    }
    return current;
}

PriceResult Collateral::price_locked(int64_t now) const {
    std::optional<Fix> exposed;
    if (rate_ok_) exposed = tracker_.exposed_rate();

    PriceResult result = pricer_.try_price(exposed, now);

    // A rate source that stays silent is as blinding as a silent feed
    if (const auto* unpriced = std::get_if<Unpriceable>(&result)) {
        int64_t rate_age = now - last_rate_at_;
        if (unpriced->reason != UnpriceableReason::PriceUnknownTooLong &&
            rate_age > config_.price_timeout_s) {
            return Unpriceable{UnpriceableReason::PriceUnknownTooLong, rate_age,
                               "no exchange rate for " + std::to_string(rate_age) + "s"};
        }
    }
    return result;
}

PriceResult Collateral::try_price() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_->now_s();

    if (monitor_.status() == CollateralStatus::DEFAULT) {
        return Unpriceable{UnpriceableReason::Defaulted, pricer_.staleness(now),
                           config_.erc20 + " has defaulted"};
    }
    return price_locked(now);
}

std::optional<PriceRange> Collateral::price() const {
    PriceResult result = try_price();
    if (const auto* estimate = std::get_if<PriceEstimate>(&result)) {
        return PriceRange{estimate->low, estimate->high};
    }
    return std::nullopt;
}

std::optional<PriceRange> Collateral::lot_price() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (monitor_.status() == CollateralStatus::DEFAULT || !saved_price_) {
        return std::nullopt;
    }

    int64_t delta = clock_->now_s() - last_save_;
    int64_t oracle_timeout = pricer_.min_oracle_timeout();
    int64_t price_timeout = config_.price_timeout_s;

    if (delta <= oracle_timeout) {
        return saved_price_;
    }
    if (delta >= oracle_timeout + price_timeout) {
        return std::nullopt;
    }

    // low decays linearly to zero, high grows linearly to 3x
    int64_t elapsed = delta - oracle_timeout;
    PriceRange decayed;
    decayed.low = fixmath::mulu_divu(saved_price_->low, price_timeout - elapsed,
                                     price_timeout, Rounding::Floor);
    decayed.high = saved_price_->high +
        fixmath::mulu_divu(saved_price_->high, 2 * elapsed, price_timeout, Rounding::Ceil);
    return decayed;
}

CollateralStatus Collateral::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitor_.status();
}

std::optional<int64_t> Collateral::iffy_since() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitor_.iffy_since();
}

std::optional<int64_t> Collateral::default_deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitor_.default_deadline();
}

Fix Collateral::ref_per_tok() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracker_.exposed_rate();
}

Fix Collateral::peak_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracker_.peak_rate();
}

Fix Collateral::claim_rewards() {
    Fix amount = 0;
    if (rewards_) {
        amount = rewards_->claim(config_.reward_recipient);
    }

    spdlog::info("{}: claimed {} {} for {}", config_.erc20, fixmath::to_string(amount),
                 config_.reward_token.empty() ? "rewards" : config_.reward_token,
                 config_.reward_recipient);

    if (events_) {
        RewardsClaimed event{config_.erc20, config_.reward_token, config_.reward_recipient,
                             amount, clock_->now_s()};
        try {
            events_->on_rewards_claimed(event);
        } catch (const std::exception& e) {
            spdlog::error("{}: failed to publish reward claim: {}", config_.erc20, e.what());
        }
    }
    return amount;
}

CollateralSnapshot Collateral::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CollateralSnapshot snapshot;
    snapshot.erc20 = config_.erc20;
    snapshot.status = monitor_.status();
    snapshot.iffy_since = monitor_.iffy_since();
    snapshot.peak_rate = tracker_.peak_rate();
    snapshot.exposed_rate = tracker_.exposed_rate();
    snapshot.saved_price = saved_price_;
    snapshot.last_save = last_save_;
    snapshot.taken_at = clock_->now_s();
    snapshot.feed_updates = pricer_.staleness_references();
    snapshot.last_rate_at = last_rate_at_;
    return snapshot;
}

void Collateral::restore(const CollateralSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (refreshed_) {
        throw std::logic_error(config_.erc20 + ": restore after refresh");
    }
    if (snapshot.erc20 != config_.erc20) {
        throw std::invalid_argument("snapshot for " + snapshot.erc20 +
                                    " cannot restore " + config_.erc20);
    }

    tracker_.restore_peak(snapshot.peak_rate);
    monitor_.restore(snapshot.status, snapshot.iffy_since);
    if (snapshot.saved_price && snapshot.last_save >= last_save_) {
        saved_price_ = snapshot.saved_price;
        last_save_ = snapshot.last_save;
    }
    // Silence that began before the restart keeps counting
    pricer_.restore_references(snapshot.feed_updates);
    if (snapshot.last_rate_at) {
        last_rate_at_ = std::min(last_rate_at_, *snapshot.last_rate_at);
    }

    spdlog::info("{}: restored {} with peak rate {}", config_.erc20,
                 status_name(monitor_.status()), fixmath::to_string(tracker_.peak_rate()));
}
