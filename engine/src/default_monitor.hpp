#pragma once

#include "fixmath.hpp"
#include <cstdint>
#include <optional>
#include <string>

enum class CollateralStatus {
    SOUND,
    IFFY,
    DEFAULT
};

std::string status_name(CollateralStatus status);
std::optional<CollateralStatus> status_from_name(const std::string& name);

struct StatusTransition {
    CollateralStatus from;
    CollateralStatus to;
    int64_t at;
};

// Everything one refresh learned that bears on soundness
struct MonitorSignals {
    bool priced = false;
    bool price_unknown_too_long = false;
    int64_t staleness_s = 0;
    Fix peg_price = 0;
    bool promise_broken = false;
};

struct MonitorParams {
    Fix default_threshold;
    Fix expected_peg;
    int64_t delay_until_default_s;
    int64_t price_timeout_s;
};

// SOUND -> IFFY -> DEFAULT with a grace timer. DEFAULT is terminal.
class DefaultMonitor {
public:
    explicit DefaultMonitor(MonitorParams params);

    // Applies one refresh worth of signals. Returns the transition, if any.
    std::optional<StatusTransition> evaluate(const MonitorSignals& signals, int64_t now);

    // Re-enter a persisted state. Never lowers the current severity.
    void restore(CollateralStatus status, std::optional<int64_t> iffy_since);

    CollateralStatus status() const { return status_; }
    std::optional<int64_t> iffy_since() const { return iffy_since_; }
    std::optional<int64_t> default_deadline() const;

    // |peg - expected| / expected
    Fix peg_deviation(Fix peg_price) const;

private:
    MonitorParams params_;
    CollateralStatus status_ = CollateralStatus::SOUND;
    std::optional<int64_t> iffy_since_;

    bool peg_broken(const MonitorSignals& signals) const;
};
