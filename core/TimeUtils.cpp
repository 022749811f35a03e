#include "core/TimeUtils.hpp"
#include <cstdio>
#include <ctime>

namespace ward {

namespace {

std::tm ToUtc(uint64_t ms_epoch) {
    auto seconds = static_cast<time_t>(ms_epoch / 1000);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &seconds);
#else
    gmtime_r(&seconds, &tm_buf);
#endif
    return tm_buf;
}

} // namespace

uint64_t CurrentTimeMillis() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    return static_cast<uint64_t>(ms.count());
}

std::string TimestampToISO8601(uint64_t ms_epoch) {
    std::tm tm_buf = ToUtc(ms_epoch);
    auto millis = ms_epoch % 1000;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(millis));

    return std::string(buf);
}

std::string TimestampToCompact(uint64_t ms_epoch) {
    std::tm tm_buf = ToUtc(ms_epoch);

    char buf[20];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);

    return std::string(buf);
}

uint64_t SteadyToEpochMillis(std::chrono::steady_clock::time_point tp) {
    auto age = std::chrono::steady_clock::now() - tp;
    auto age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(age).count();
    int64_t now_ms = static_cast<int64_t>(CurrentTimeMillis());
    int64_t result = now_ms - age_ms;
    return result > 0 ? static_cast<uint64_t>(result) : 0;
}

} // namespace ward
