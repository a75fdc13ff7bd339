#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

#include "common/worker_pool.hpp"

// 定时器：调度线程负责计时，到期任务交给 WorkerPool 执行
class TimerScheduler {
public:
    using Task      = std::function<void()>;
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::milliseconds;

    explicit TimerScheduler(std::size_t numWorkers = 1);
    ~TimerScheduler();

    void shutdown();

    // 注册单次定时任务
    std::size_t registerTimer(Duration delay, Task task);

    // 注册重复定时任务，首次在 interval 之后触发；同一任务不会并发执行
    std::size_t registerRepeatingTimer(Duration interval, Task task);

    // 立即触发一次，之后按 interval 重复
    std::size_t registerRepeatingTimerNow(Duration interval, Task task);

    // 取消任务；正在执行的那一次不受影响
    bool cancelTimer(std::size_t id);

    std::size_t activeTimers() const;

private:
    struct TimerTask {
        TimePoint   nextRun;
        Duration    interval;
        bool        repeat;
        std::size_t id;

        bool operator<(const TimerTask& other) const {
            return nextRun > other.nextRun;
        }
    };

    std::size_t addTask(Task task, Duration firstDelay, Duration interval, bool repeat);
    void        schedulerLoop();
    void        runTask(std::size_t id, bool repeat, Duration interval);

    WorkerPool  pool_;
    std::thread schedulerThread_;

    std::priority_queue<TimerTask>        queue_;
    std::unordered_map<std::size_t, Task> taskMap_;

    mutable std::mutex      mtx_;
    std::condition_variable cv_;

    bool                     stop_ = false;
    std::atomic<std::size_t> nextId_{0};
};
