// job_registry.hpp
#pragma once
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "scheduler/cancel_token.hpp"
#include "scheduler/job_lifecycle_event.h"
#include "scheduler/job_record.hpp"
#include "scheduler/job_target.hpp"

// 每个作业的内部句柄：取消令牌 + 终态通知
struct JobHandle {
    CancelToken                         token;
    std::shared_ptr<std::promise<void>> finished;
    std::shared_future<void>            done;     // 只读观察者，wait() 用它，不影响作业本身

    static JobHandle create();
};

// id -> (记录, 结果, 句柄)，所有读写都在同一把锁下完成
class JobRegistry {
public:
    JobRegistry() = default;
    ~JobRegistry() = default;

    // 禁止拷贝
    JobRegistry(const JobRegistry&)            = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // ID 冲突抛 AlreadyScheduled
    void insert(JobRecord record, JobHandle handle);
    // 未知 ID 抛 NotFound
    void erase(const JobId& id);

    bool        contains(const JobId& id) const;
    std::size_t size() const;

    // 以下读取均返回副本，未知 ID 抛 NotFound
    JobRecord record(const JobId& id) const;
    JobStatus status(const JobId& id) const;
    JobHandle handle(const JobId& id) const;

    // 按提交时间倒序（最新在前）
    std::vector<JobRecord> snapshot(std::optional<JobStatus> filter = std::nullopt) const;

    // 非终态作业的句柄，关闭时使用
    std::vector<std::pair<JobId, JobHandle>> unfinished() const;

    // completed 返回结果；failed 抛 JobFailureError；其余抛 NotFinished
    JobResult result(const JobId& id) const;

    // 状态迁移：非法迁移（含 ID 已删除）返回 false，不修改任何字段
    bool markRunning(const JobId& id);
    bool markCompleted(const JobId& id, JobResult result);
    bool markFailed(const JobId& id, std::string error, std::string traceback);
    bool markCanceled(const JobId& id);
    // 仅当作业仍为 pending 时取消（启动前取消）
    bool markCanceledIfPending(const JobId& id);

    // 生命周期回调注册
    void addLifecycleCb(JobLifecycleCb cb);

private:
    struct Entry {
        JobRecord                record;
        std::optional<JobResult> result;
        JobHandle                handle;
    };

    template <typename Apply>
    bool transition(const JobId& id, JobStatus to, Apply&& apply,
                    std::optional<JobStatus> requiredFrom = std::nullopt);

    void notify(JobEvent ev, const JobRecord& record) const;

    mutable std::mutex                   mtx_;
    std::unordered_map<JobId, Entry>     jobs_;

    mutable std::mutex                   cbMtx_;
    std::vector<JobLifecycleCb>          cbs_;
};
