#pragma once

#include "default_monitor.hpp"
#include "fixmath.hpp"
#include <string>

struct StatusChanged {
    std::string erc20;
    CollateralStatus from;
    CollateralStatus to;
    int64_t at;
};

struct RewardsClaimed {
    std::string erc20;
    std::string reward_token;
    std::string recipient;
    Fix amount;
    int64_t at;
};

// Receiver of collateral notifications. Implementations must not call back
// into the collateral that emitted the event.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_status_changed(const StatusChanged& event) = 0;
    virtual void on_rewards_claimed(const RewardsClaimed& event) = 0;
};
