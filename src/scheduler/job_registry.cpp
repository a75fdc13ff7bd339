// job_registry.cpp
#include "scheduler/job_registry.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "scheduler/scheduler_error.hpp"

const char* to_string(JobEvent ev) {
    switch (ev) {
        case JobEvent::Submitted: return "submitted";
        case JobEvent::Started:   return "started";
        case JobEvent::Finished:  return "finished";
        case JobEvent::Removed:   return "removed";
    }
    return "unknown";
}

JobHandle JobHandle::create() {
    JobHandle h;
    h.finished = std::make_shared<std::promise<void>>();
    h.done     = h.finished->get_future().share();
    return h;
}

namespace {

[[noreturn]] void throwNotFound(const JobId& id) {
    throw SchedulerError(SchedulerErrc::NotFound, "Job not found: " + id.str());
}

// 时钟回拨时保证时间戳不早于前一个阶段
JobTimePoint notBefore(JobTimePoint earlier) {
    return std::max(JobClock::now(), earlier);
}

} // namespace

void JobRegistry::insert(JobRecord record, JobHandle handle) {
    JobRecord copy = record;
    {
        std::lock_guard lg(mtx_);
        if (jobs_.count(record.id)) {
            spdlog::error("JobRegistry: job {} already scheduled", record.id.str());
            throw SchedulerError(SchedulerErrc::AlreadyScheduled,
                                 "Job " + record.id.str() + " already scheduled");
        }
        auto id = record.id;
        jobs_.emplace(std::move(id), Entry{std::move(record), std::nullopt, std::move(handle)});
    }
    notify(JobEvent::Submitted, copy);
}

void JobRegistry::erase(const JobId& id) {
    JobRecord removed;          // 先拷贝出来，再回调，避免锁内回调
    {
        std::lock_guard lg(mtx_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) throwNotFound(id);
        removed = std::move(it->second.record);
        jobs_.erase(it);
    }
    notify(JobEvent::Removed, removed);
}

bool JobRegistry::contains(const JobId& id) const {
    std::lock_guard lg(mtx_);
    return jobs_.count(id) > 0;
}

std::size_t JobRegistry::size() const {
    std::lock_guard lg(mtx_);
    return jobs_.size();
}

JobRecord JobRegistry::record(const JobId& id) const {
    std::lock_guard lg(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) throwNotFound(id);
    return it->second.record;
}

JobStatus JobRegistry::status(const JobId& id) const {
    std::lock_guard lg(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) throwNotFound(id);
    return it->second.record.status;
}

JobHandle JobRegistry::handle(const JobId& id) const {
    std::lock_guard lg(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) throwNotFound(id);
    return it->second.handle;
}

std::vector<JobRecord> JobRegistry::snapshot(std::optional<JobStatus> filter) const {
    std::vector<JobRecord> out;
    {
        std::lock_guard lg(mtx_);
        out.reserve(jobs_.size());
        for (const auto& [id, entry] : jobs_) {
            if (filter && entry.record.status != *filter) continue;
            out.push_back(entry.record);
        }
    }
    // ID 单调递增，提交时间相同时用 ID 定序
    std::sort(out.begin(), out.end(), [](const JobRecord& a, const JobRecord& b) {
        if (a.submitted_at != b.submitted_at) return a.submitted_at > b.submitted_at;
        return a.id > b.id;
    });
    return out;
}

std::vector<std::pair<JobId, JobHandle>> JobRegistry::unfinished() const {
    std::vector<std::pair<JobId, JobHandle>> out;
    std::lock_guard lg(mtx_);
    for (const auto& [id, entry] : jobs_) {
        if (!isTerminal(entry.record.status)) out.emplace_back(id, entry.handle);
    }
    return out;
}

JobResult JobRegistry::result(const JobId& id) const {
    std::lock_guard lg(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) throwNotFound(id);

    const auto& rec = it->second.record;
    switch (rec.status) {
        case JobStatus::Completed:
            return it->second.result.value_or(JobResult{});
        case JobStatus::Failed:
            throw JobFailureError(rec.error.value_or("Job failed"),
                                  rec.error_traceback.value_or(""));
        default:
            throw SchedulerError(SchedulerErrc::NotFinished,
                                 std::string("Job not finished (status=") + to_string(rec.status) + ")");
    }
}

template <typename Apply>
bool JobRegistry::transition(const JobId& id, JobStatus to, Apply&& apply,
                             std::optional<JobStatus> requiredFrom) {
    JobRecord copy;
    std::shared_ptr<std::promise<void>> finished;
    {
        std::lock_guard lg(mtx_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) return false;
        auto& entry = it->second;
        if (requiredFrom && entry.record.status != *requiredFrom) return false;
        if (!canTransition(entry.record.status, to)) {
            spdlog::debug("JobRegistry: ignore transition {} -> {} for job {}",
                          to_string(entry.record.status), to_string(to), id.str());
            return false;
        }
        entry.record.status = to;
        apply(entry);
        copy = entry.record;
        if (isTerminal(to)) finished = entry.handle.finished;
    }

    spdlog::debug("JobRegistry: job {} -> {}", id.str(), to_string(to));
    notify(isTerminal(to) ? JobEvent::Finished : JobEvent::Started, copy);
    // 回调全部执行完再唤醒等待者
    if (finished) finished->set_value();
    return true;
}

bool JobRegistry::markRunning(const JobId& id) {
    return transition(id, JobStatus::Running, [](Entry& e) {
        e.record.started_at = notBefore(e.record.submitted_at);
    });
}

bool JobRegistry::markCompleted(const JobId& id, JobResult result) {
    return transition(id, JobStatus::Completed, [&result](Entry& e) {
        e.record.finished_at = notBefore(e.record.started_at.value_or(e.record.submitted_at));
        // 返回值本身是作业 ID 时作为关联 ID 记录
        if (const auto* artifact = std::any_cast<JobId>(&result)) {
            e.record.artifact_id = *artifact;
        }
        e.result = std::move(result);
    });
}

bool JobRegistry::markFailed(const JobId& id, std::string error, std::string traceback) {
    return transition(id, JobStatus::Failed, [&](Entry& e) {
        e.record.finished_at     = notBefore(e.record.started_at.value_or(e.record.submitted_at));
        e.record.error           = std::move(error);
        e.record.error_traceback = std::move(traceback);
    });
}

bool JobRegistry::markCanceled(const JobId& id) {
    return transition(id, JobStatus::Canceled, [](Entry& e) {
        e.record.finished_at = notBefore(e.record.started_at.value_or(e.record.submitted_at));
    });
}

bool JobRegistry::markCanceledIfPending(const JobId& id) {
    return transition(id, JobStatus::Canceled, [](Entry& e) {
        e.record.finished_at = notBefore(e.record.submitted_at);
    }, JobStatus::Pending);
}

void JobRegistry::addLifecycleCb(JobLifecycleCb cb) {
    std::lock_guard lg(cbMtx_);
    cbs_.push_back(std::move(cb));
}

void JobRegistry::notify(JobEvent ev, const JobRecord& record) const {
    std::vector<JobLifecycleCb> cbs;
    {
        std::lock_guard lg(cbMtx_);
        cbs = cbs_;
    }
    for (const auto& cb : cbs) {
        try {
            cb(ev, record);
        } catch (const std::exception& e) {
            spdlog::error("JobRegistry: lifecycle callback failed on {} for job {}: {}",
                          to_string(ev), record.id.str(), e.what());
        } catch (...) {
            spdlog::error("JobRegistry: lifecycle callback failed on {} for job {}: unknown exception",
                          to_string(ev), record.id.str());
        }
    }
}
