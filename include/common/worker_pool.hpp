#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// 固定大小的工作线程池，FIFO 执行投递的任务
class WorkerPool {
public:
    using Task = std::function<void()>;

    // min(32, 硬件线程数 + 4)
    static std::size_t defaultWorkerCount();

    WorkerPool(std::string name, std::size_t numWorkers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // 已停止时返回 false，任务不会执行
    bool post(Task task);

    // 不再接受新任务，执行完队列中剩余任务后回收线程；可重复调用
    void shutdown();

    std::size_t workerCount() const { return numWorkers_; }
    std::size_t queueSize() const;
    bool        stopped() const { return stop_.load(); }

    // 当前线程所属的 worker 名称，非池线程返回空串
    static const std::string& currentWorkerName();

private:
    void workerLoop(std::size_t index);

    std::string              name_;
    std::size_t              numWorkers_;
    std::vector<std::thread> workers_;

    std::queue<Task>        taskQueue_;
    mutable std::mutex      queueMtx_;
    std::condition_variable queueCv_;
    std::mutex              joinMtx_;

    std::atomic<bool> stop_{false};
};
