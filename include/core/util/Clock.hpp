#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace offcache {
namespace core {
namespace util {

using SystemClock = std::chrono::system_clock;
using TimePoint = SystemClock::time_point;

// IClock — источник времени, подменяется в тестах
class IClock {
public:
    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
};

// RealClock — системные часы
class RealClock : public IClock {
public:
    TimePoint now() const override { return SystemClock::now(); }
};

// ManualClock — часы, которые двигаются только вручную
class ManualClock : public IClock {
public:
    explicit ManualClock(TimePoint start = SystemClock::now());
    TimePoint now() const override;
    void set(TimePoint tp); // Установить время
    void advance(std::chrono::milliseconds delta); // Сдвинуть вперёд
private:
    mutable std::mutex mutex_;
    TimePoint current_;
};

// ISO-8601 UTC с миллисекундами: 2026-10-19T12:00:00.000Z
std::string toIsoString(TimePoint tp);
std::optional<TimePoint> parseIsoString(const std::string& text);

int64_t toUnixMillis(TimePoint tp);

} // namespace util
} // namespace core
} // namespace offcache
