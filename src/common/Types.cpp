#include "common/Types.h"
#include <ctime>

namespace fibcycle {

std::string formatTimestamp(long long timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M", &tm_utc);
    return buffer;
}

} // namespace fibcycle
