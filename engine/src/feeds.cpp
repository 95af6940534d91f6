#include "feeds.hpp"
#include "util.hpp"

int64_t SystemClock::now_s() const {
    return util::current_timestamp_s();
}
