#include "scheduler/job_scheduler.hpp"

#include <spdlog/spdlog.h>

SchedulerOptions SchedulerOptions::fromConfig(const Config& config) {
    SchedulerOptions opts;
    config.unknownKeys("scheduler_config", {"name", "max_concurrency", "worker_threads"});
    opts.name = config.getOr<std::string>("scheduler_config", "name", opts.name);
    if (config.has("scheduler_config", "max_concurrency")) {
        opts.maxConcurrency = config.getInt("scheduler_config", "max_concurrency");
    }
    if (config.has("scheduler_config", "worker_threads")) {
        auto workers = config.getInt("scheduler_config", "worker_threads");
        if (workers <= 0) {
            throw std::runtime_error("Config: [scheduler_config][worker_threads] must be positive");
        }
        opts.workerThreads = static_cast<std::size_t>(workers);
    }
    return opts;
}

JobScheduler::JobScheduler(SchedulerOptions options)
    : options_(std::move(options)),
      pool_(options_.name, options_.workerThreads),
      runner_(registry_, pool_, [this] { return currentLimiter(); }) {
    setMaxConcurrency(options_.maxConcurrency);
    spdlog::info("JobScheduler: [{}] initialized with {} workers, max concurrency {}",
                 options_.name, pool_.workerCount(),
                 options_.maxConcurrency && *options_.maxConcurrency > 0
                     ? std::to_string(*options_.maxConcurrency) : std::string("unbounded"));
}

JobScheduler::~JobScheduler() {
    shutdown();
}

JobId JobScheduler::submit(JobTarget target) {
    if (!target.thunk) {
        throw SchedulerError(SchedulerErrc::InvalidArgument, "job target is empty");
    }

    JobRecord record;
    record.id           = JobId::generate();
    record.status       = JobStatus::Pending;
    record.submitted_at = JobClock::now();

    auto id     = record.id;
    auto handle = JobHandle::create();
    registry_.insert(std::move(record), handle);

    spdlog::info("JobScheduler: [{}] job {} submitted ({})", options_.name, id.str(), to_string(target.kind));
    runner_.launch(id, std::move(target), handle.token);
    return id;
}

JobStatus JobScheduler::getStatus(const JobId& id) const {
    return registry_.status(id);
}

JobRecord JobScheduler::getRecord(const JobId& id) const {
    return registry_.record(id);
}

std::vector<JobRecord> JobScheduler::getAllRecords(std::optional<JobStatus> filter) const {
    return registry_.snapshot(filter);
}

void JobScheduler::requestCancel(const JobId& id, const JobHandle& handle) {
    handle.token.requestCancel();
    // 尚未开始运行的作业直接进入 canceled，runner 取到它时会跳过
    if (registry_.markCanceledIfPending(id)) {
        spdlog::info("JobScheduler: [{}] job {} canceled before start", options_.name, id.str());
    }
}

bool JobScheduler::cancel(const JobId& id) {
    auto handle = registry_.handle(id);
    if (isTerminal(registry_.status(id))) {
        return false;
    }

    spdlog::info("JobScheduler: [{}] cancel requested for job {}", options_.name, id.str());
    requestCancel(id, handle);
    // 等待作业体观察到取消
    handle.done.wait();
    return true;
}

void JobScheduler::deleteJob(const JobId& id) {
    auto handle = registry_.handle(id);
    if (!isTerminal(registry_.status(id))) {
        requestCancel(id, handle);
        handle.done.wait();
    }
    registry_.erase(id);
    spdlog::info("JobScheduler: [{}] job {} deleted", options_.name, id.str());
}

void JobScheduler::wait(const JobId& id, std::optional<std::chrono::milliseconds> timeout) const {
    // 拷贝出的 shared_future 只是观察者，超时或调用方放弃都不影响作业
    auto done = registry_.handle(id).done;
    if (!timeout) {
        done.wait();
        return;
    }
    if (done.wait_for(*timeout) != std::future_status::ready) {
        throw SchedulerError(SchedulerErrc::Timeout,
                             "Timed out after " + std::to_string(timeout->count()) +
                             "ms waiting for job " + id.str());
    }
}

JobResult JobScheduler::getResult(const JobId& id) const {
    return registry_.result(id);
}

void JobScheduler::setMaxConcurrency(std::optional<int> n) {
    std::lock_guard lg(limiterMtx_);
    if (n && *n > 0) {
        limiter_ = ConcurrencyLimiter::create(static_cast<std::size_t>(*n));
        options_.maxConcurrency = n;
    } else {
        limiter_.reset();
        options_.maxConcurrency.reset();
    }
    spdlog::debug("JobScheduler: [{}] max concurrency set to {}", options_.name,
                  limiter_ ? std::to_string(limiter_->capacity()) : std::string("unbounded"));
}

std::optional<int> JobScheduler::maxConcurrency() const {
    std::lock_guard lg(limiterMtx_);
    return options_.maxConcurrency;
}

std::shared_ptr<ConcurrencyLimiter> JobScheduler::currentLimiter() const {
    std::lock_guard lg(limiterMtx_);
    return limiter_;
}

void JobScheduler::addLifecycleCb(JobLifecycleCb cb) {
    registry_.addLifecycleCb(std::move(cb));
}

void JobScheduler::shutdown() {
    {
        std::lock_guard lg(shutdownMtx_);
        if (shutdown_) return;
        shutdown_ = true;
    }

    auto pending = registry_.unfinished();
    if (!pending.empty()) {
        spdlog::info("JobScheduler: [{}] shutting down, canceling {} unfinished jobs",
                     options_.name, pending.size());
    }
    for (const auto& [id, handle] : pending) {
        requestCancel(id, handle);
    }
    pool_.shutdown();
    spdlog::info("JobScheduler: [{}] shutdown complete", options_.name);
}
