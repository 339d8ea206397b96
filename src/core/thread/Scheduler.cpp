#include "core/thread/Scheduler.hpp"
#include "core/util/Logging.hpp"
#include <utility>

namespace offcache {
namespace core {
namespace thread {

ThreadScheduler::ThreadScheduler(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : util::makeNullLogger()) {}

ThreadScheduler::~ThreadScheduler() {
    stop();
}

bool ThreadScheduler::start(std::chrono::milliseconds interval, Tick tick) {
    if (running_.load(std::memory_order_acquire)) {
        logger_->warn("ThreadScheduler: уже запущен");
        return false;
    }
    if (worker_.joinable()) {
        // Поток, остановленный изнутри tick
        worker_.join();
    }
    interval_ = interval;
    tick_ = std::move(tick);
    shouldExit_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this] { run(); });
    logger_->debug("ThreadScheduler: запущен с интервалом {} мс", interval_.count());
    return true;
}

void ThreadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        shouldExit_.store(true, std::memory_order_release);
    }
    waitCv_.notify_all();

    if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
        // Вызов из tick: поток завершится сам после возврата
        running_.store(false, std::memory_order_release);
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    if (running_.exchange(false, std::memory_order_acq_rel)) {
        logger_->debug("ThreadScheduler: остановлен");
    }
}

bool ThreadScheduler::isRunning() const {
    return running_.load(std::memory_order_acquire);
}

void ThreadScheduler::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(waitMutex_);
            if (waitCv_.wait_for(lock, interval_, [this] {
                    return shouldExit_.load(std::memory_order_acquire);
                })) {
                break;
            }
        }
        try {
            tick_();
        } catch (const std::exception& e) {
            logger_->error("ThreadScheduler: ошибка в задаче: {}", e.what());
        } catch (...) {
            logger_->error("ThreadScheduler: неизвестная ошибка в задаче");
        }
    }
}

bool ManualScheduler::start(std::chrono::milliseconds interval, Tick tick) {
    if (running_) {
        return false;
    }
    interval_ = interval;
    elapsed_ = std::chrono::milliseconds(0);
    tick_ = std::move(tick);
    running_ = true;
    return true;
}

void ManualScheduler::stop() {
    running_ = false;
}

void ManualScheduler::advance(std::chrono::milliseconds delta) {
    if (!running_ || interval_.count() <= 0) {
        return;
    }
    elapsed_ += delta;
    while (running_ && elapsed_ >= interval_) {
        elapsed_ -= interval_;
        ++ticks_;
        tick_();
    }
}

ScheduleHandle::ScheduleHandle(std::shared_ptr<IScheduler> scheduler)
    : scheduler_(std::move(scheduler)) {}

void ScheduleHandle::cancel() {
    if (scheduler_) {
        scheduler_->stop();
    }
}

bool ScheduleHandle::isActive() const {
    return scheduler_ && scheduler_->isRunning();
}

} // namespace thread
} // namespace core
} // namespace offcache
