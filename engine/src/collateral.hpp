#pragma once

#include "appreciation_tracker.hpp"
#include "collateral_config.hpp"
#include "default_monitor.hpp"
#include "events.hpp"
#include "feeds.hpp"
#include "pricer.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct PriceRange {
    Fix low;
    Fix high;
};

// Persistable view of the mutable state of one collateral
struct CollateralSnapshot {
    std::string erc20;
    CollateralStatus status = CollateralStatus::SOUND;
    std::optional<int64_t> iffy_since;
    Fix peak_rate = 0;
    Fix exposed_rate = 0;
    std::optional<PriceRange> saved_price;
    int64_t last_save = 0;
    int64_t taken_at = 0;
    // Per feed, the timestamp its staleness is measured from
    std::vector<int64_t> feed_updates;
    std::optional<int64_t> last_rate_at;
};

nlohmann::json snapshot_to_json(const CollateralSnapshot& snapshot);
CollateralSnapshot snapshot_from_json(const nlohmann::json& j);

// Collateral adapter for one wrapped, appreciating token. Owns its
// appreciation, pricing and soundness state; mutates it only in refresh().
class Collateral {
public:
    // Throws ConfigInvalid
    Collateral(CollateralConfig config,
               Fix revenue_hiding,
               std::shared_ptr<ExchangeRateSource> rate_source,
               std::shared_ptr<Clock> clock,
               std::shared_ptr<EventSink> events,
               std::shared_ptr<RewardSource> rewards = nullptr);

    Collateral(const Collateral&) = delete;
    Collateral& operator=(const Collateral&) = delete;

    // Re-read every collaborator, advance the tracker and the state machine.
    // Collaborators are read without holding the lock. Their failures never
    // escape.
    CollateralStatus refresh();

    // Price from the state cached by the last refresh
    PriceResult try_price() const;

    // Empty when the price is unknown or the collateral has defaulted
    std::optional<PriceRange> price() const;

    // Last saved price, decayed with its age. Usable for sizing lots while
    // the live price is unavailable.
    std::optional<PriceRange> lot_price() const;

    CollateralStatus status() const;
    std::optional<int64_t> iffy_since() const;
    std::optional<int64_t> default_deadline() const;

    // {ref/tok} after revenue hiding
    Fix ref_per_tok() const;
    Fix peak_rate() const;
    // {target/ref}
    Fix target_per_ref() const { return config_.expected_peg; }

    // Forward accrued rewards to the configured recipient. Returns the
    // amount claimed; throws FeedError if the reward source fails.
    Fix claim_rewards();

    const std::string& erc20() const { return config_.erc20; }
    const std::string& target_name() const { return config_.target_name; }
    std::string pricing_mode() const { return pricing_mode_name(config_.pricing); }
    Fix max_trade_volume() const { return config_.max_trade_volume; }
    Fix revenue_hiding() const { return tracker_.revenue_hiding(); }

    CollateralSnapshot snapshot() const;

    // Only before the first refresh. Never lowers the peak or the severity.
    void restore(const CollateralSnapshot& snapshot);

private:
    CollateralConfig config_;
    std::shared_ptr<ExchangeRateSource> rate_source_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> events_;
    std::shared_ptr<RewardSource> rewards_;

    mutable std::mutex mutex_;
    AppreciationTracker tracker_;
    Pricer pricer_;
    DefaultMonitor monitor_;

    bool rate_ok_ = false;
    int64_t last_rate_at_;
    bool refreshed_ = false;
    std::optional<PriceRange> saved_price_;
    int64_t last_save_ = 0;

    PriceResult price_locked(int64_t now) const;
};
