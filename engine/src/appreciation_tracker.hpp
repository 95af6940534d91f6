#pragma once

#include "fixmath.hpp"

// High-water mark of the true exchange rate and the exposed rate derived
// from it. The exposed rate is peak * (1 - h): it never decreases for a fixed
// h and never exceeds the peak.
class AppreciationTracker {
public:
    // revenue_hiding must be in [0, 1)
    explicit AppreciationTracker(Fix revenue_hiding);

    // raw_rate >= 0, throws std::invalid_argument otherwise.
    // Returns the exposed rate after the update.
    Fix update(Fix raw_rate);

    // Raise the peak from persisted state; never lowers it
    void restore_peak(Fix peak_rate);

    Fix peak_rate() const { return peak_rate_; }
    Fix last_raw_rate() const { return last_raw_rate_; }
    Fix exposed_rate() const;
    Fix revenue_hiding() const { return revenue_hiding_; }

    bool has_observed() const { return observed_; }

    // True rate fell below what the exposed rate already promises
    bool promise_broken() const;

private:
    Fix revenue_hiding_;
    Fix revenue_showing_;
    Fix peak_rate_ = 0;
    Fix last_raw_rate_ = 0;
    bool observed_ = false;
};
