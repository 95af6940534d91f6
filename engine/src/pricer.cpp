#include "pricer.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

using fixmath::Rounding;

std::string reason_name(UnpriceableReason reason) {
    switch (reason) {
        case UnpriceableReason::FeedStale: return "FEED_STALE";
        case UnpriceableReason::FeedUnavailable: return "FEED_UNAVAILABLE";
        case UnpriceableReason::RateUnavailable: return "RATE_UNAVAILABLE";
        case UnpriceableReason::PriceUnknownTooLong: return "PRICE_UNKNOWN_TOO_LONG";
        case UnpriceableReason::Defaulted: return "DEFAULTED";
    }
    return "UNKNOWN";
}

Pricer::Pricer(PricingMode mode, Fix oracle_error, int64_t price_timeout_s,
               Fix expected_peg, int64_t created_at)
    : mode_(std::move(mode))
    , bindings_(feed_bindings(mode_))
    , oracle_error_(oracle_error)
    , price_timeout_s_(price_timeout_s)
    , expected_peg_(expected_peg)
{
    for (size_t i = 0; i < bindings_.size(); ++i) {
        observations_.push_back(FeedObservation{std::nullopt, "not yet observed", created_at});
    }

    Fix growth = fixmath::pow(fixmath::FIX_ONE + oracle_error_,
                              static_cast<unsigned>(bindings_.size()), Rounding::Ceil);
    combined_error_ = growth - fixmath::FIX_ONE;
}

std::vector<FeedRead> Pricer::read_feeds() const {
    std::vector<FeedRead> reads(bindings_.size());
    for (size_t i = 0; i < bindings_.size(); ++i) {
        const auto& feed = bindings_[i].feed;
        try {
            reads[i].reading = feed->latest();
        } catch (const std::exception& e) {
            reads[i].error = e.what();
            spdlog::warn("Feed {} read failed: {}", feed->describe(), e.what());
        }
    }
    return reads;
}

void Pricer::apply(const std::vector<FeedRead>& reads, int64_t now) {
    if (reads.size() != bindings_.size()) {
        throw std::invalid_argument("expected " + std::to_string(bindings_.size()) +
                                    " feed reads, got " + std::to_string(reads.size()));
    }

    for (size_t i = 0; i < bindings_.size(); ++i) {
        auto& obs = observations_[i];
        const auto& read = reads[i];

        if (!read.reading) {
            obs.reading.reset();
            obs.error = read.error.empty() ? "no reading" : read.error;
            continue;
        }
        if (read.reading->price <= 0) {
            obs.reading.reset();
            obs.error = "non-positive price " + fixmath::to_string(read.reading->price);
            spdlog::warn("Feed {} reported {}", bindings_[i].feed->describe(), obs.error);
            continue;
        }

        obs.reading = read.reading;
        obs.error.clear();
        // The feed's own timestamp replaces the construction-time reference
        obs.last_known_update = obs.answered
            ? std::max(obs.last_known_update, read.reading->updated_at)
            : read.reading->updated_at;
        obs.answered = true;
    }
    spdlog::debug("Observed {} feeds at {}", bindings_.size(), now);
}

std::vector<int64_t> Pricer::staleness_references() const {
    std::vector<int64_t> refs;
    for (const auto& obs : observations_) {
        refs.push_back(obs.last_known_update);
    }
    return refs;
}

void Pricer::restore_references(const std::vector<int64_t>& references) {
    if (references.empty()) return;
    if (references.size() != observations_.size()) {
        spdlog::warn("Ignoring {} persisted feed references for {} feeds",
                     references.size(), observations_.size());
        return;
    }
    for (size_t i = 0; i < observations_.size(); ++i) {
        auto& obs = observations_[i];
        if (!obs.answered) {
            obs.last_known_update = std::min(obs.last_known_update, references[i]);
        }
    }
}

int64_t Pricer::staleness(int64_t now) const {
    int64_t oldest = now;
    for (const auto& obs : observations_) {
        oldest = std::min(oldest, obs.last_known_update);
    }
    return now - oldest;
}

int64_t Pricer::min_oracle_timeout() const {
    int64_t timeout = bindings_.front().timeout_s;
    for (const auto& binding : bindings_) {
        timeout = std::min(timeout, binding.timeout_s);
    }
    return timeout;
}

std::optional<Unpriceable> Pricer::check_feeds(int64_t now) const {
    int64_t total = staleness(now);
    if (total > price_timeout_s_) {
        return Unpriceable{UnpriceableReason::PriceUnknownTooLong, total,
                           "no fresh price for " + std::to_string(total) + "s"};
    }

    for (size_t i = 0; i < bindings_.size(); ++i) {
        const auto& obs = observations_[i];
        const auto& binding = bindings_[i];

        if (!obs.reading) {
            return Unpriceable{UnpriceableReason::FeedUnavailable, total,
                               binding.feed->describe() + ": " + obs.error};
        }

        int64_t age = std::max<int64_t>(0, now - obs.reading->updated_at);
        if (age > binding.timeout_s) {
            return Unpriceable{UnpriceableReason::FeedStale, total,
                               binding.feed->describe() + " is " + std::to_string(age) + "s old"};
        }
    }
    return std::nullopt;
}

Fix Pricer::reading_price(size_t index) const {
    return observations_[index].reading->price;
}

PriceResult Pricer::try_price(std::optional<Fix> exposed_rate, int64_t now) const {
    if (auto failure = check_feeds(now)) {
        return *failure;
    }
    if (!exposed_rate) {
        return Unpriceable{UnpriceableReason::RateUnavailable, staleness(now),
                           "exchange rate unavailable"};
    }

    try {
        Fix uoa_per_ref = 0;
        Fix peg_price = 0;

        std::visit(overloaded{
            [&](const FiatPegged&) {
                uoa_per_ref = reading_price(0);
                peg_price = reading_price(0);
            },
            [&](const SelfReferential&) {
                uoa_per_ref = reading_price(0);
                peg_price = expected_peg_;
            },
            [&](const NonFiat&) {
                peg_price = reading_price(0);
                uoa_per_ref = fixmath::mul(reading_price(1), peg_price);
            },
        }, mode_);

        // {UoA/tok} = {UoA/ref} * {ref/tok}
        Fix mid = fixmath::mul(uoa_per_ref, *exposed_rate);
        Fix err = fixmath::mul(mid, combined_error_, Rounding::Ceil);

        PriceEstimate estimate;
        estimate.mid = mid;
        estimate.low = std::max<Fix>(0, mid - err);
        estimate.high = mid + err;
        estimate.peg_price = peg_price;
        return estimate;

    } catch (const std::exception& e) {
        return Unpriceable{UnpriceableReason::FeedUnavailable, staleness(now),
                           std::string("price arithmetic failed: ") + e.what()};
    }
}
