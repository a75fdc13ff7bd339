#pragma once

#include <functional>
#include <memory>
#include <string>

#include "common/worker_pool.hpp"
#include "scheduler/concurrency_limiter.hpp"
#include "scheduler/job_registry.hpp"
#include "scheduler/job_target.hpp"

// 驱动单个作业的状态机：
//   pending --(拿到许可)--> running --> completed | failed | canceled
//   pending --(启动前被取消)--> canceled
// 作业体抛出的任何异常都在这里被捕获并写入记录，不会逃出 worker
class JobRunner {
public:
    // 每次启动作业时取当前的限流器，nullptr 表示不限流
    using LimiterProvider = std::function<std::shared_ptr<ConcurrencyLimiter>()>;

    JobRunner(JobRegistry& registry, WorkerPool& pool, LimiterProvider limiter);

    // 非阻塞：投递到线程池后立即返回；线程池已停止时作业直接标记为取消
    void launch(const JobId& id, JobTarget target, CancelToken token);

private:
    void run(const JobId& id, const JobTarget& target, const CancelToken& token);

    JobRegistry&    registry_;
    WorkerPool&     pool_;
    LimiterProvider limiter_;
};
