#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "common/timer_scheduler.hpp"
#include "scheduler/job_scheduler.hpp"

// SSE 单条事件：data: <payload>\n\n
std::string formatSseEvent(const std::string& data);

// 按固定间隔轮询作业记录，把每次的记录序列化为 SSE 事件推给 sink，
// 作业进入终态或被删除后自动结束。调度器本身只支持拉取，推送在这一层实现
class JobWatcher {
public:
    using Sink    = std::function<void(const std::string& event)>;
    using OnClose = std::function<void()>;

    static constexpr auto kDefaultPollInterval = std::chrono::milliseconds{500};

    JobWatcher(const JobScheduler& scheduler, TimerScheduler& timers);
    ~JobWatcher();

    JobWatcher(const JobWatcher&)            = delete;
    JobWatcher& operator=(const JobWatcher&) = delete;

    // 未知 ID 抛 NotFound；第一条事件立即推送
    std::size_t watch(const JobId& id,
                      Sink sink,
                      std::chrono::milliseconds interval = kDefaultPollInterval,
                      OnClose onClose = {});

    // 主动停止，不会触发 onClose
    bool unwatch(std::size_t watchId);

    std::size_t activeWatches() const;

private:
    struct Watch;

    void poll(const std::shared_ptr<Watch>& w);
    void close(const std::shared_ptr<Watch>& w, bool notify);

    const JobScheduler& scheduler_;
    TimerScheduler&     timers_;

    mutable std::mutex                                      mtx_;
    std::unordered_map<std::size_t, std::shared_ptr<Watch>> watches_;
};
