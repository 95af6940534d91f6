#pragma once

#include <stdexcept>
#include <string>

// Construction-time rejection. A collateral that throws this never exists.
class ConfigInvalid : public std::runtime_error {
public:
    explicit ConfigInvalid(const std::string& what)
        : std::runtime_error("invalid collateral config: " + what) {}
};

// Raised by external collaborators (oracle feeds, rate sources, reward
// sources) when a read or claim fails.
class FeedError : public std::runtime_error {
public:
    explicit FeedError(const std::string& what) : std::runtime_error(what) {}
};
