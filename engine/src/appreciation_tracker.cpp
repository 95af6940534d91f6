#include "appreciation_tracker.hpp"
#include <algorithm>
#include <stdexcept>

AppreciationTracker::AppreciationTracker(Fix revenue_hiding)
    : revenue_hiding_(revenue_hiding)
    , revenue_showing_(fixmath::FIX_ONE - revenue_hiding)
{
    if (revenue_hiding < 0 || revenue_hiding >= fixmath::FIX_ONE) {
        throw std::invalid_argument("revenue hiding must be in [0, 1)");
    }
}

Fix AppreciationTracker::update(Fix raw_rate) {
    if (raw_rate < 0) {
        throw std::invalid_argument("negative exchange rate: " + fixmath::to_string(raw_rate));
    }

    peak_rate_ = std::max(peak_rate_, raw_rate);
    last_raw_rate_ = raw_rate;
    observed_ = true;

    return exposed_rate();
}

void AppreciationTracker::restore_peak(Fix peak_rate) {
    if (peak_rate < 0) {
        throw std::invalid_argument("negative peak rate: " + fixmath::to_string(peak_rate));
    }
    peak_rate_ = std::max(peak_rate_, peak_rate);
}

Fix AppreciationTracker::exposed_rate() const {
    return fixmath::mul(peak_rate_, revenue_showing_, fixmath::Rounding::Floor);
}

bool AppreciationTracker::promise_broken() const {
    return observed_ && last_raw_rate_ < exposed_rate();
}
