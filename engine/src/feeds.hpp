#pragma once

#include "fixmath.hpp"
#include <cstdint>
#include <string>

struct FeedReading {
    Fix price;
    int64_t updated_at;  // unix seconds
};

// Price source for one unit conversion. latest() may throw FeedError.
class OracleFeed {
public:
    virtual ~OracleFeed() = default;

    virtual FeedReading latest() = 0;
    virtual std::string describe() const = 0;
};

// Raw reference-units-per-token rate of the wrapped token. May throw FeedError.
class ExchangeRateSource {
public:
    virtual ~ExchangeRateSource() = default;

    virtual Fix current_rate() = 0;
};

// Claims the separate reward stream of a wrapped token on behalf of
// recipient and returns the amount claimed. May throw FeedError.
class RewardSource {
public:
    virtual ~RewardSource() = default;

    virtual Fix claim(const std::string& recipient) = 0;
};

class Clock {
public:
    virtual ~Clock() = default;

    virtual int64_t now_s() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t now_s() const override;
};
