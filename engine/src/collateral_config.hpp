#pragma once

#include "feeds.hpp"
#include "fixmath.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

// Longest grace period a collateral may spend IFFY: two weeks
constexpr int64_t MAX_DELAY_UNTIL_DEFAULT_S = 1209600;

struct FeedBinding {
    std::shared_ptr<OracleFeed> feed;
    int64_t timeout_s = 0;
};

// One feed reporting UoA per reference; target == UoA.
struct FiatPegged {
    FeedBinding uoa_per_ref;
};

// One feed reporting UoA per target, where target == reference.
struct SelfReferential {
    FeedBinding uoa_per_target;
};

// Two chained feeds: target per reference, then UoA per target.
struct NonFiat {
    FeedBinding target_per_ref;
    FeedBinding uoa_per_target;
};

using PricingMode = std::variant<FiatPegged, SelfReferential, NonFiat>;

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string pricing_mode_name(const PricingMode& mode);

// Feeds of a mode, in the order they are chained
std::vector<FeedBinding> feed_bindings(const PricingMode& mode);

struct CollateralConfig {
    std::string erc20;
    std::string target_name;
    PricingMode pricing;

    Fix oracle_error = 0;
    Fix max_trade_volume = 0;
    Fix default_threshold = 0;
    int64_t delay_until_default_s = 0;
    int64_t price_timeout_s = 0;

    // Target per reference while the peg holds
    Fix expected_peg = fixmath::FIX_ONE;

    std::string reward_token;
    std::string reward_recipient;

    // Throws ConfigInvalid
    void validate() const;
};
