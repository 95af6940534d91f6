#pragma once

#include "collateral_config.hpp"
#include "feeds.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

// All values in UoA per token, except peg_price in target per reference
struct PriceEstimate {
    Fix low;
    Fix mid;
    Fix high;
    Fix peg_price;
};

enum class UnpriceableReason {
    FeedStale,
    FeedUnavailable,
    RateUnavailable,
    PriceUnknownTooLong,
    Defaulted
};

std::string reason_name(UnpriceableReason reason);

struct Unpriceable {
    UnpriceableReason reason;
    int64_t staleness_s;
    std::string detail;
};

using PriceResult = std::variant<PriceEstimate, Unpriceable>;

// One attempt at reading a feed
struct FeedRead {
    std::optional<FeedReading> reading;
    std::string error;
};

// What the last refresh saw on one feed
struct FeedObservation {
    std::optional<FeedReading> reading;
    std::string error;
    // updated_at of the newest good reading. Until the feed first answers,
    // the time its silence is counted from.
    int64_t last_known_update;
    bool answered = false;
};

class Pricer {
public:
    Pricer(PricingMode mode, Fix oracle_error, int64_t price_timeout_s,
           Fix expected_peg, int64_t created_at);

    // Read every feed without touching the cached observations. Feed
    // failures are recorded, never thrown.
    std::vector<FeedRead> read_feeds() const;

    // Cache one round of reads. Non-positive prices count as failures.
    void apply(const std::vector<FeedRead>& reads, int64_t now);

    void observe(int64_t now) { apply(read_feeds(), now); }

    // Per feed, the timestamp staleness is measured from
    std::vector<int64_t> staleness_references() const;

    // Pull the silence reference of feeds that have not answered yet back to
    // persisted values. Never moves a reference forward.
    void restore_references(const std::vector<int64_t>& references);

    // Pure function of the cached observations. exposed_rate is empty when
    // the exchange rate could not be read this cycle.
    PriceResult try_price(std::optional<Fix> exposed_rate, int64_t now) const;

    // Seconds since the stalest feed last reported successfully
    int64_t staleness(int64_t now) const;

    // Relative error band after composing the per-feed error over every
    // feed in the mode: (1 + e)^n - 1
    Fix combined_error() const { return combined_error_; }

    // Smallest per-feed timeout
    int64_t min_oracle_timeout() const;

    const std::vector<FeedObservation>& observations() const { return observations_; }

private:
    PricingMode mode_;
    std::vector<FeedBinding> bindings_;
    std::vector<FeedObservation> observations_;
    Fix oracle_error_;
    Fix combined_error_;
    int64_t price_timeout_s_;
    Fix expected_peg_;

    std::optional<Unpriceable> check_feeds(int64_t now) const;
    Fix reading_price(size_t index) const;
};
