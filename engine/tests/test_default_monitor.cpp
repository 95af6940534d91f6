#include <catch2/catch_test_macros.hpp>
#include "../src/default_monitor.hpp"
#include "stubs.hpp"
#include <stdexcept>

namespace {

MonitorParams params() {
    // 1% threshold, one day grace, one week price timeout
    return MonitorParams{fp("0.01"), fixmath::FIX_ONE, 86400, 604800};
}

MonitorSignals priced_at(const std::string& peg) {
    MonitorSignals s;
    s.priced = true;
    s.peg_price = fp(peg);
    return s;
}

MonitorSignals unpriced(int64_t staleness, bool too_long) {
    MonitorSignals s;
    s.priced = false;
    s.staleness_s = staleness;
    s.price_unknown_too_long = too_long;
    return s;
}

} // namespace

TEST_CASE("Peg deviation drives the grace timer", "[default_monitor]") {
    DefaultMonitor monitor(params());
    REQUIRE(monitor.status() == CollateralStatus::SOUND);

    auto entered = monitor.evaluate(priced_at("0.98"), 0);
    REQUIRE(entered.has_value());
    REQUIRE(entered->from == CollateralStatus::SOUND);
    REQUIRE(entered->to == CollateralStatus::IFFY);
    REQUIRE(monitor.iffy_since() == 0);
    REQUIRE(monitor.default_deadline() == 86400);

    SECTION("Deviation persisting through the delay defaults") {
        REQUIRE_FALSE(monitor.evaluate(priced_at("0.98"), 43200).has_value());
        REQUIRE(monitor.iffy_since() == 0);

        auto defaulted = monitor.evaluate(priced_at("0.98"), 86400);
        REQUIRE(defaulted.has_value());
        REQUIRE(defaulted->to == CollateralStatus::DEFAULT);
        REQUIRE(monitor.status() == CollateralStatus::DEFAULT);
    }

    SECTION("Recovery before the delay returns to SOUND") {
        auto recovered = monitor.evaluate(priced_at("0.995"), 500);
        REQUIRE(recovered.has_value());
        REQUIRE(recovered->to == CollateralStatus::SOUND);
        REQUIRE(monitor.status() == CollateralStatus::SOUND);
        REQUIRE_FALSE(monitor.iffy_since().has_value());
        REQUIRE_FALSE(monitor.default_deadline().has_value());
    }

    SECTION("Recovery one second before the deadline still counts") {
        monitor.evaluate(priced_at("1.0"), 86399);
        REQUIRE(monitor.status() == CollateralStatus::SOUND);
    }

    SECTION("Recovery at the deadline is too late") {
        monitor.evaluate(priced_at("1.0"), 86400);
        REQUIRE(monitor.status() == CollateralStatus::DEFAULT);
    }

    SECTION("Upward deviation counts as well") {
        DefaultMonitor other(params());
        other.evaluate(priced_at("1.02"), 0);
        REQUIRE(other.status() == CollateralStatus::IFFY);
    }

    SECTION("Re-entering IFFY restarts the timer") {
        monitor.evaluate(priced_at("1.0"), 500);
        monitor.evaluate(priced_at("0.97"), 1000);
        REQUIRE(monitor.iffy_since() == 1000);
        monitor.evaluate(priced_at("0.97"), 86400);
        REQUIRE(monitor.status() == CollateralStatus::IFFY);
        monitor.evaluate(priced_at("0.97"), 87400);
        REQUIRE(monitor.status() == CollateralStatus::DEFAULT);
    }
}

TEST_CASE("DEFAULT is terminal", "[default_monitor]") {
    DefaultMonitor monitor(params());
    monitor.evaluate(priced_at("0.9"), 0);
    monitor.evaluate(priced_at("0.9"), 86400);
    REQUIRE(monitor.status() == CollateralStatus::DEFAULT);

    for (int64_t t = 86401; t < 86401 + 10 * 3600; t += 3600) {
        REQUIRE_FALSE(monitor.evaluate(priced_at("1.0"), t).has_value());
        REQUIRE(monitor.status() == CollateralStatus::DEFAULT);
    }

    monitor.restore(CollateralStatus::SOUND, std::nullopt);
    REQUIRE(monitor.status() == CollateralStatus::DEFAULT);
}

TEST_CASE("Unknown prices", "[default_monitor]") {
    DefaultMonitor monitor(params());

    SECTION("Stale within the price timeout changes nothing") {
        REQUIRE_FALSE(monitor.evaluate(unpriced(3601, false), 3601).has_value());
        REQUIRE(monitor.status() == CollateralStatus::SOUND);
    }

    SECTION("Unknown beyond the price timeout defaults immediately") {
        auto t = monitor.evaluate(unpriced(604801, true), 604801);
        REQUIRE(t.has_value());
        REQUIRE(t->from == CollateralStatus::SOUND);
        REQUIRE(t->to == CollateralStatus::DEFAULT);
    }

    SECTION("An IFFY collateral keeps its timer while unpriced") {
        monitor.evaluate(priced_at("0.98"), 0);
        monitor.evaluate(unpriced(100, false), 100);
        REQUIRE(monitor.status() == CollateralStatus::IFFY);
        REQUIRE(monitor.iffy_since() == 0);
        monitor.evaluate(unpriced(86400, false), 86400);
        REQUIRE(monitor.status() == CollateralStatus::DEFAULT);
    }
}

TEST_CASE("Broken appreciation promise", "[default_monitor]") {
    DefaultMonitor monitor(params());
    MonitorSignals s = priced_at("1.0");
    s.promise_broken = true;

    monitor.evaluate(s, 10);
    REQUIRE(monitor.status() == CollateralStatus::IFFY);

    s.promise_broken = false;
    monitor.evaluate(s, 20);
    REQUIRE(monitor.status() == CollateralStatus::SOUND);
}

TEST_CASE("Peg too far off to measure", "[default_monitor]") {
    // Expected peg of 0.001: the relative deviation of a huge peg overflows
    DefaultMonitor monitor(MonitorParams{fp("0.01"), fp("0.001"), 86400, 604800});
    MonitorSignals s;
    s.priced = true;
    s.peg_price = fixmath::FIX_MAX / 2;

    REQUIRE_THROWS_AS(monitor.peg_deviation(s.peg_price), std::overflow_error);

    std::optional<StatusTransition> t;
    REQUIRE_NOTHROW(t = monitor.evaluate(s, 100));
    REQUIRE(t.has_value());
    REQUIRE(t->to == CollateralStatus::IFFY);
    REQUIRE(monitor.iffy_since() == 100);
}

TEST_CASE("Evaluation is idempotent at one instant", "[default_monitor]") {
    DefaultMonitor monitor(params());
    REQUIRE(monitor.evaluate(priced_at("0.98"), 5).has_value());
    REQUIRE_FALSE(monitor.evaluate(priced_at("0.98"), 5).has_value());
    REQUIRE(monitor.status() == CollateralStatus::IFFY);
    REQUIRE(monitor.iffy_since() == 5);
}

TEST_CASE("Status names round-trip", "[default_monitor]") {
    REQUIRE(status_from_name(status_name(CollateralStatus::IFFY)) == CollateralStatus::IFFY);
    REQUIRE_FALSE(status_from_name("DISABLED").has_value());
}
