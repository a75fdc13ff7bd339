#pragma once

#include <any>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/worker_pool.hpp"
#include "scheduler/concurrency_limiter.hpp"
#include "scheduler/job_lifecycle_event.h"
#include "scheduler/job_record.hpp"
#include "scheduler/job_registry.hpp"
#include "scheduler/job_runner.hpp"
#include "scheduler/job_target.hpp"
#include "scheduler/scheduler_error.hpp"

struct SchedulerOptions {
    std::string        name = "jobpilot";
    std::optional<int> maxConcurrency;                       // <= 0 或缺省表示不限
    std::size_t        workerThreads = WorkerPool::defaultWorkerCount();

    // 读取 scheduler_config 段
    static SchedulerOptions fromConfig(const Config& config);
};

// 进程内后台作业调度器。
//
// 作业目标三种形态：
//   - 同步函数：scheduler.addJob(fn, args...)
//   - 异步函数：返回 std::future / std::shared_future 的函数，scheduler.addJob(fn, args...)
//   - 预先构造的 future：scheduler.addJob(std::move(fut))，不允许再带参数
// 第一个参数为 const CancelToken& 的函数会收到作业令牌，用于协作式取消。
class JobScheduler {
public:
    explicit JobScheduler(SchedulerOptions options = {});
    ~JobScheduler();

    JobScheduler(const JobScheduler&)            = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    // 提交作业，立即返回 ID；作业体在线程池中异步执行
    template <typename Target, typename... Args>
    JobId addJob(Target&& target, Args&&... args) {
        return submit(makeJobTarget(std::forward<Target>(target), std::forward<Args>(args)...));
    }

    JobId submit(JobTarget target);

    JobStatus              getStatus(const JobId& id) const;
    JobRecord              getRecord(const JobId& id) const;
    std::vector<JobRecord> getAllRecords(std::optional<JobStatus> filter = std::nullopt) const;

    // 运行中/排队中：请求取消并等到取消被观察到，返回 true；已是终态返回 false
    bool cancel(const JobId& id);

    // 尽力取消后删除记录、结果和句柄
    void deleteJob(const JobId& id);

    // 阻塞调用方直到作业进入终态；超时抛 Timeout，但不会取消作业
    void wait(const JobId& id,
              std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    JobResult getResult(const JobId& id) const;

    template <typename T>
    T getResult(const JobId& id) const {
        return std::any_cast<T>(getResult(id));
    }

    // 新限流器只影响之后开始等待许可的作业
    void               setMaxConcurrency(std::optional<int> n);
    std::optional<int> maxConcurrency() const;

    void addLifecycleCb(JobLifecycleCb cb);

    // 取消所有未完成作业并回收线程；析构时自动调用
    void shutdown();

    const std::string& name() const { return options_.name; }

private:
    std::shared_ptr<ConcurrencyLimiter> currentLimiter() const;
    void requestCancel(const JobId& id, const JobHandle& handle);

    SchedulerOptions options_;
    JobRegistry      registry_;
    WorkerPool       pool_;
    JobRunner        runner_;

    mutable std::mutex                  limiterMtx_;
    std::shared_ptr<ConcurrencyLimiter> limiter_;

    std::mutex shutdownMtx_;
    bool       shutdown_ = false;
};
