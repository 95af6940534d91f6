#include "default_monitor.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string status_name(CollateralStatus status) {
    switch (status) {
        case CollateralStatus::SOUND: return "SOUND";
        case CollateralStatus::IFFY: return "IFFY";
        case CollateralStatus::DEFAULT: return "DEFAULT";
    }
    return "UNKNOWN";
}

std::optional<CollateralStatus> status_from_name(const std::string& name) {
    if (name == "SOUND") return CollateralStatus::SOUND;
    if (name == "IFFY") return CollateralStatus::IFFY;
    if (name == "DEFAULT") return CollateralStatus::DEFAULT;
    return std::nullopt;
}

DefaultMonitor::DefaultMonitor(MonitorParams params) : params_(params) {}

std::optional<int64_t> DefaultMonitor::default_deadline() const {
    if (status_ != CollateralStatus::IFFY || !iffy_since_) return std::nullopt;
    return *iffy_since_ + params_.delay_until_default_s;
}

Fix DefaultMonitor::peg_deviation(Fix peg_price) const {
    return fixmath::div(fixmath::abs_diff(peg_price, params_.expected_peg),
                        params_.expected_peg, fixmath::Rounding::Ceil);
}

bool DefaultMonitor::peg_broken(const MonitorSignals& signals) const {
    if (signals.promise_broken) return true;
    try {
        return peg_deviation(signals.peg_price) > params_.default_threshold;
    } catch (const std::exception& e) {
        // A deviation too large to represent is past any threshold
        spdlog::warn("Peg deviation of {} not representable: {}",
                     fixmath::to_string(signals.peg_price), e.what());
        return true;
    }
}

std::optional<StatusTransition> DefaultMonitor::evaluate(const MonitorSignals& signals, int64_t now) {
    CollateralStatus before = status_;

    if (status_ == CollateralStatus::DEFAULT) {
        return std::nullopt;
    }

    if (status_ == CollateralStatus::IFFY && now >= *default_deadline()) {
        spdlog::error("Grace period expired ({}s in IFFY), defaulting",
                      now - *iffy_since_);
        status_ = CollateralStatus::DEFAULT;
        iffy_since_.reset();
    } else if (!signals.priced) {
        if (signals.price_unknown_too_long && signals.staleness_s > params_.price_timeout_s) {
            spdlog::error("Price unknown for {}s (timeout {}s), defaulting",
                          signals.staleness_s, params_.price_timeout_s);
            status_ = CollateralStatus::DEFAULT;
            iffy_since_.reset();
        }
        // Otherwise wait: a stale feed alone is not evidence against the peg
    } else if (peg_broken(signals)) {
        if (status_ == CollateralStatus::SOUND) {
            status_ = CollateralStatus::IFFY;
            iffy_since_ = now;
            spdlog::warn("Peg broken (peg={}, promise_broken={}), IFFY until {}",
                         fixmath::to_string(signals.peg_price), signals.promise_broken,
                         now + params_.delay_until_default_s);
        }
    } else if (status_ == CollateralStatus::IFFY) {
        spdlog::warn("Peg recovered after {}s in IFFY", now - *iffy_since_);
        status_ = CollateralStatus::SOUND;
        iffy_since_.reset();
    }

    if (status_ == before) return std::nullopt;
    return StatusTransition{before, status_, now};
}

void DefaultMonitor::restore(CollateralStatus status, std::optional<int64_t> iffy_since) {
    if (status == CollateralStatus::DEFAULT) {
        status_ = CollateralStatus::DEFAULT;
        iffy_since_.reset();
    } else if (status == CollateralStatus::IFFY && status_ == CollateralStatus::SOUND) {
        if (!iffy_since) {
            throw std::invalid_argument("IFFY state requires an iffy_since timestamp");
        }
        status_ = CollateralStatus::IFFY;
        iffy_since_ = iffy_since;
    }
}
