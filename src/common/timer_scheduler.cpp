#include "common/timer_scheduler.hpp"
#include <spdlog/spdlog.h>

TimerScheduler::TimerScheduler(std::size_t numWorkers)
    : pool_("timer", numWorkers) {
    schedulerThread_ = std::thread([this] { schedulerLoop(); });
}

TimerScheduler::~TimerScheduler() {
    shutdown();
}

void TimerScheduler::shutdown() {
    {
        std::lock_guard lg(mtx_);
        if (stop_ && !schedulerThread_.joinable()) return;
        stop_ = true;
    }
    cv_.notify_all();
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
    pool_.shutdown();
}

std::size_t TimerScheduler::registerTimer(Duration delay, Task task) {
    return addTask(std::move(task), delay, delay, false);
}

std::size_t TimerScheduler::registerRepeatingTimer(Duration interval, Task task) {
    return addTask(std::move(task), interval, interval, true);
}

std::size_t TimerScheduler::registerRepeatingTimerNow(Duration interval, Task task) {
    return addTask(std::move(task), Duration::zero(), interval, true);
}

bool TimerScheduler::cancelTimer(std::size_t id) {
    std::lock_guard lg(mtx_);
    return taskMap_.erase(id) > 0;
}

std::size_t TimerScheduler::activeTimers() const {
    std::lock_guard lg(mtx_);
    return taskMap_.size();
}

std::size_t TimerScheduler::addTask(Task task, Duration firstDelay, Duration interval, bool repeat) {
    auto id = nextId_++;
    {
        std::lock_guard lg(mtx_);
        taskMap_.emplace(id, std::move(task));
        queue_.push(TimerTask{Clock::now() + firstDelay, interval, repeat, id});
    }
    cv_.notify_one();
    return id;
}

void TimerScheduler::schedulerLoop() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stop_) {
        if (queue_.empty()) {
            cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            continue;
        }

        auto next = queue_.top();
        if (next.nextRun > Clock::now()) {
            cv_.wait_until(lock, next.nextRun);
            continue;
        }
        queue_.pop();

        // 已取消的任务直接丢弃
        if (!taskMap_.count(next.id)) continue;

        lock.unlock();
        pool_.post([this, next] { runTask(next.id, next.repeat, next.interval); });
        lock.lock();
    }
}

void TimerScheduler::runTask(std::size_t id, bool repeat, Duration interval) {
    Task task;
    {
        std::lock_guard lg(mtx_);
        if (stop_) return;
        auto it = taskMap_.find(id);
        if (it == taskMap_.end()) return;
        task = it->second;
        if (!repeat) taskMap_.erase(it);
    }

    try {
        task();
    } catch (const std::exception& e) {
        spdlog::error("TimerScheduler: task {} execution failed: {}", id, e.what());
    } catch (...) {
        spdlog::error("TimerScheduler: task {} execution failed: unknown exception", id);
    }

    if (!repeat) return;

    // 执行完毕后再排下一次，避免同一任务重叠执行
    {
        std::lock_guard lg(mtx_);
        if (stop_ || !taskMap_.count(id)) return;
        queue_.push(TimerTask{Clock::now() + interval, interval, true, id});
    }
    cv_.notify_one();
}
