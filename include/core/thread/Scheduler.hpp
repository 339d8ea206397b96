#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <spdlog/spdlog.h>

namespace offcache {
namespace core {
namespace thread {

using Tick = std::function<void()>;

// IScheduler — периодический вызов tick с фиксированным интервалом
class IScheduler {
public:
    virtual ~IScheduler() = default;
    virtual bool start(std::chrono::milliseconds interval, Tick tick) = 0; // false, если уже запущен
    virtual void stop() = 0; // Больше ни одного tick; текущий завершается
    virtual bool isRunning() const = 0;
};

// ThreadScheduler — фоновый поток, ожидание на condition_variable
class ThreadScheduler : public IScheduler {
public:
    explicit ThreadScheduler(std::shared_ptr<spdlog::logger> logger = nullptr);
    ~ThreadScheduler() override;
    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    bool start(std::chrono::milliseconds interval, Tick tick) override;
    void stop() override;
    bool isRunning() const override;

private:
    void run();

    std::shared_ptr<spdlog::logger> logger_;
    std::thread worker_;
    std::chrono::milliseconds interval_{0};
    Tick tick_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shouldExit_{false};
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
};

// ManualScheduler — виртуальное время для тестов; потоков нет
class ManualScheduler : public IScheduler {
public:
    bool start(std::chrono::milliseconds interval, Tick tick) override;
    void stop() override;
    bool isRunning() const override { return running_; }

    void advance(std::chrono::milliseconds delta); // По одному tick на каждый прошедший интервал
    uint64_t tickCount() const { return ticks_; }

private:
    std::chrono::milliseconds interval_{0};
    std::chrono::milliseconds elapsed_{0};
    Tick tick_;
    bool running_ = false;
    uint64_t ticks_ = 0;
};

// ScheduleHandle — отмена запланированной задачи
class ScheduleHandle {
public:
    ScheduleHandle() = default;
    explicit ScheduleHandle(std::shared_ptr<IScheduler> scheduler);

    void cancel();
    bool isActive() const;

private:
    std::shared_ptr<IScheduler> scheduler_;
};

} // namespace thread
} // namespace core
} // namespace offcache
