#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace util {

std::string current_iso8601() {
    return to_iso8601(current_timestamp_s());
}

std::string to_iso8601(int64_t unix_s) {
    auto itt = static_cast<std::time_t>(unix_s);
    std::tm tm_buf{};
    gmtime_r(&itt, &tm_buf);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_s() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string redact_dsn(const std::string& dsn) {
    auto scheme = dsn.find("://");
    auto at = dsn.rfind('@');
    if (scheme == std::string::npos || at == std::string::npos || at < scheme) {
        return dsn;
    }

    auto colon = dsn.find(':', scheme + 3);
    if (colon == std::string::npos || colon > at) {
        return dsn;
    }
    return dsn.substr(0, colon + 1) + "***" + dsn.substr(at);
}

} // namespace util
