#include "scheduler/job_runner.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "scheduler/failure_info.hpp"

JobRunner::JobRunner(JobRegistry& registry, WorkerPool& pool, LimiterProvider limiter)
    : registry_(registry), pool_(pool), limiter_(std::move(limiter)) {}

void JobRunner::launch(const JobId& id, JobTarget target, CancelToken token) {
    auto posted = pool_.post([this, id, target = std::move(target), token]() {
        run(id, target, token);
    });
    if (!posted) {
        spdlog::warn("JobRunner: pool stopped, job {} canceled before start", id.str());
        token.requestCancel();
        registry_.markCanceled(id);
    }
}

void JobRunner::run(const JobId& id, const JobTarget& target, const CancelToken& token) {
    // 排队期间已被取消或删除
    if (token.cancelled()) {
        registry_.markCanceled(id);
        return;
    }

    ConcurrencyLimiter::Permit permit;
    if (auto limiter = limiter_ ? limiter_() : nullptr) {
        auto acquired = limiter->acquire(token);
        if (!acquired) {
            registry_.markCanceled(id);
            return;
        }
        permit = std::move(*acquired);
    }

    if (!registry_.markRunning(id)) {
        // 等待许可期间已被取消，许可随 permit 析构归还
        return;
    }
    spdlog::debug("JobRunner: job {} started on {} ({})",
                  id.str(), WorkerPool::currentWorkerName(), to_string(target.kind));

    try {
        JobResult result;
        {
            this_job::ScopedToken scope(token);
            result = target.thunk(token);
        }
        // 作业体返回时取消请求已到达，同样视为取消
        if (token.cancelled()) {
            registry_.markCanceled(id);
            spdlog::info("JobRunner: job {} canceled", id.str());
            return;
        }
        registry_.markCompleted(id, std::move(result));
        spdlog::debug("JobRunner: job {} completed", id.str());
    } catch (const JobCanceled&) {
        registry_.markCanceled(id);
        spdlog::info("JobRunner: job {} canceled", id.str());
    } catch (...) {
        auto context = fmt::format("job {}, {} target, {}",
                                   id.str(), to_string(target.kind), WorkerPool::currentWorkerName());
        auto failure = captureFailure(std::current_exception(), context);
        spdlog::warn("JobRunner: job {} failed: {}", id.str(), failure.error);
        registry_.markFailed(id, std::move(failure.error), std::move(failure.traceback));
    }
}
