#include "collateral_config.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace {

void validate_binding(const FeedBinding& binding, const std::string& name) {
    if (!binding.feed) {
        throw ConfigInvalid(name + " feed missing");
    }
    if (binding.timeout_s <= 0) {
        throw ConfigInvalid(name + " timeout must be positive");
    }
}

} // namespace

std::string pricing_mode_name(const PricingMode& mode) {
    return std::visit(overloaded{
        [](const FiatPegged&) { return std::string("fiat"); },
        [](const SelfReferential&) { return std::string("self_referential"); },
        [](const NonFiat&) { return std::string("non_fiat"); },
    }, mode);
}

std::vector<FeedBinding> feed_bindings(const PricingMode& mode) {
    return std::visit(overloaded{
        [](const FiatPegged& m) { return std::vector<FeedBinding>{m.uoa_per_ref}; },
        [](const SelfReferential& m) { return std::vector<FeedBinding>{m.uoa_per_target}; },
        [](const NonFiat& m) {
            return std::vector<FeedBinding>{m.target_per_ref, m.uoa_per_target};
        },
    }, mode);
}

void CollateralConfig::validate() const {
    if (erc20.empty()) {
        throw ConfigInvalid("erc20 missing");
    }
    if (target_name.empty()) {
        throw ConfigInvalid("target name missing");
    }

    std::visit(overloaded{
        [](const FiatPegged& m) { validate_binding(m.uoa_per_ref, "uoa/ref"); },
        [](const SelfReferential& m) { validate_binding(m.uoa_per_target, "uoa/target"); },
        [](const NonFiat& m) {
            validate_binding(m.target_per_ref, "target/ref");
            validate_binding(m.uoa_per_target, "uoa/target");
        },
    }, pricing);

    if (oracle_error <= 0 || oracle_error >= fixmath::FIX_ONE) {
        throw ConfigInvalid("oracle error out of range");
    }
    if (max_trade_volume <= 0) {
        throw ConfigInvalid("max trade volume must be positive");
    }
    if (default_threshold <= 0 || default_threshold >= fixmath::FIX_ONE) {
        throw ConfigInvalid("default threshold out of range");
    }
    if (delay_until_default_s <= 0) {
        throw ConfigInvalid("delay until default must be positive");
    }
    if (delay_until_default_s > MAX_DELAY_UNTIL_DEFAULT_S) {
        throw ConfigInvalid("delay until default too long");
    }
    if (price_timeout_s <= 0) {
        throw ConfigInvalid("price timeout must be positive");
    }
    if (expected_peg <= 0) {
        throw ConfigInvalid("expected peg must be positive");
    }

    spdlog::debug("Config for {} validated: mode={}, target={}",
                  erc20, pricing_mode_name(pricing), target_name);
}
