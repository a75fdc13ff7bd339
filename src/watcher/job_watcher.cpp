#include "watcher/job_watcher.hpp"

#include <atomic>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

std::string formatSseEvent(const std::string& data) {
    return "data: " + data + "\n\n";
}

struct JobWatcher::Watch {
    JobId             id;
    Sink              sink;
    OnClose           onClose;
    std::size_t       timerId = 0;
    std::atomic<bool> closed{false};
    std::mutex        m;          // 串行化同一个 watch 的轮询与关闭
};

JobWatcher::JobWatcher(const JobScheduler& scheduler, TimerScheduler& timers)
    : scheduler_(scheduler), timers_(timers) {}

JobWatcher::~JobWatcher() {
    std::vector<std::shared_ptr<Watch>> all;
    {
        std::lock_guard lg(mtx_);
        for (const auto& [_, w] : watches_) all.push_back(w);
    }
    for (const auto& w : all) {
        std::lock_guard lg(w->m);
        close(w, false);
    }
}

std::size_t JobWatcher::watch(const JobId& id, Sink sink,
                              std::chrono::milliseconds interval, OnClose onClose) {
    // 先确认作业存在，不存在直接抛 NotFound
    scheduler_.getRecord(id);

    auto w     = std::make_shared<Watch>();
    w->id      = id;
    w->sink    = std::move(sink);
    w->onClose = std::move(onClose);

    // 持有 w->m 直到 timerId 写入，首轮 poll 会在这之后执行
    std::lock_guard wl(w->m);
    w->timerId = timers_.registerRepeatingTimerNow(interval, [this, w] { poll(w); });
    {
        std::lock_guard lg(mtx_);
        watches_.emplace(w->timerId, w);
    }
    spdlog::debug("JobWatcher: watching job {} every {}ms (watch {})",
                  id.str(), interval.count(), w->timerId);
    return w->timerId;
}

bool JobWatcher::unwatch(std::size_t watchId) {
    std::shared_ptr<Watch> w;
    {
        std::lock_guard lg(mtx_);
        auto it = watches_.find(watchId);
        if (it == watches_.end()) return false;
        w = it->second;
    }
    std::lock_guard wl(w->m);
    if (w->closed) return false;
    close(w, false);
    return true;
}

std::size_t JobWatcher::activeWatches() const {
    std::lock_guard lg(mtx_);
    return watches_.size();
}

void JobWatcher::poll(const std::shared_ptr<Watch>& w) {
    std::lock_guard wl(w->m);
    if (w->closed) return;

    try {
        auto record = scheduler_.getRecord(w->id);
        w->sink(formatSseEvent(nlohmann::json(record).dump()));
        if (isTerminal(record.status)) {
            close(w, true);
        }
    } catch (const SchedulerError& e) {
        if (e.code() != SchedulerErrc::NotFound) throw;
        // 作业已被删除
        w->sink(formatSseEvent(R"({"status": "deleted"})"));
        close(w, true);
    }
}

// 调用方持有 w->m
void JobWatcher::close(const std::shared_ptr<Watch>& w, bool notify) {
    if (w->closed.exchange(true)) return;
    timers_.cancelTimer(w->timerId);
    {
        std::lock_guard lg(mtx_);
        watches_.erase(w->timerId);
    }
    spdlog::debug("JobWatcher: watch {} for job {} closed", w->timerId, w->id.str());
    if (notify && w->onClose) w->onClose();
}
