#include "core/util/Clock.hpp"
#include <cstdio>
#include <ctime>

namespace offcache {
namespace core {
namespace util {

ManualClock::ManualClock(TimePoint start) : current_(start) {}

TimePoint ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void ManualClock::set(TimePoint tp) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = tp;
}

void ManualClock::advance(std::chrono::milliseconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ += delta;
}

std::string toIsoString(TimePoint tp) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    int ms = static_cast<int>(millis % 1000);
    if (ms < 0) {
        ms += 1000;
        seconds -= 1;
    }
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, ms);
    return buffer;
}

std::optional<TimePoint> parseIsoString(const std::string& text) {
    std::tm utc{};
    int ms = 0;
    int consumed = 0;
    // Дробная часть секунд необязательна
    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                             &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                             &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &consumed);
    if (fields != 6) {
        return std::nullopt;
    }
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                ms = ms * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        for (; digits < 3; ++digits) {
            ms *= 10;
        }
    }
    if (pos < text.size() && text[pos] != 'Z') {
        return std::nullopt;
    }
    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    std::time_t seconds = timegm(&utc);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return TimePoint(std::chrono::seconds(seconds)) + std::chrono::milliseconds(ms);
}

int64_t toUnixMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace util
} // namespace core
} // namespace offcache
