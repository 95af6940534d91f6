#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    std::string to_iso8601(int64_t unix_s);
    int64_t current_timestamp_s();
    int64_t current_timestamp_ms();

    // Masks the password of a libpq connection URI for logging
    std::string redact_dsn(const std::string& dsn);
}
