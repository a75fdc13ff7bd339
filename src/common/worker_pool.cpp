#include "common/worker_pool.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace {
thread_local std::string g_workerName;
} // namespace

std::size_t WorkerPool::defaultWorkerCount() {
    std::size_t hw = std::thread::hardware_concurrency();
    return std::min<std::size_t>(32, hw + 4);
}

WorkerPool::WorkerPool(std::string name, std::size_t numWorkers)
    : name_(std::move(name)), numWorkers_(std::max<std::size_t>(1, numWorkers)) {
    workers_.reserve(numWorkers_);
    for (std::size_t i = 0; i < numWorkers_; ++i) {
        workers_.emplace_back([this, i] { workerLoop(i); });
    }
    spdlog::debug("WorkerPool: '{}' started with {} workers", name_, numWorkers_);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::post(Task task) {
    {
        std::lock_guard lg(queueMtx_);
        if (stop_) {
            spdlog::warn("WorkerPool: '{}' is stopped, task rejected", name_);
            return false;
        }
        taskQueue_.push(std::move(task));
    }
    queueCv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lg(queueMtx_);
        stop_ = true;
    }
    queueCv_.notify_all();

    std::lock_guard lg(joinMtx_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

std::size_t WorkerPool::queueSize() const {
    std::lock_guard lg(queueMtx_);
    return taskQueue_.size();
}

const std::string& WorkerPool::currentWorkerName() {
    return g_workerName;
}

void WorkerPool::workerLoop(std::size_t index) {
    g_workerName = name_ + "-worker-" + std::to_string(index);

    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queueMtx_);
            queueCv_.wait(lock, [this] { return stop_ || !taskQueue_.empty(); });
            // 停止后仍把队列清空再退出
            if (taskQueue_.empty()) break;
            task = std::move(taskQueue_.front());
            taskQueue_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("WorkerPool: task execution failed on {}: {}", g_workerName, e.what());
        } catch (...) {
            spdlog::error("WorkerPool: task execution failed on {}: unknown exception", g_workerName);
        }
    }
}
