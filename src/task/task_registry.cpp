// task_registry.cpp
#include "task/task_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "scheduler/scheduler_error.hpp"

TaskRegistry& TaskRegistry::instance() {
    static TaskRegistry reg;
    return reg;
}

void TaskRegistry::registerTask(std::string name, TaskFunc fn) {
    if (!fn) {
        throw std::invalid_argument("TaskRegistry: empty task function for '" + name + "'");
    }
    std::lock_guard lg(mtx_);
    if (tasks_.count(name)) {
        throw std::invalid_argument("Task '" + name + "' already registered");
    }
    spdlog::debug("TaskRegistry: registered task '{}'", name);
    tasks_.emplace(std::move(name), std::move(fn));
}

TaskFunc TaskRegistry::get(const std::string& name) const {
    std::lock_guard lg(mtx_);
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        throw SchedulerError(SchedulerErrc::NotFound, "Task '" + name + "' not found in registry");
    }
    return it->second;
}

bool TaskRegistry::contains(const std::string& name) const {
    std::lock_guard lg(mtx_);
    return tasks_.count(name) > 0;
}

std::vector<std::string> TaskRegistry::list() const {
    std::vector<std::string> out;
    {
        std::lock_guard lg(mtx_);
        out.reserve(tasks_.size());
        for (const auto& [k, _] : tasks_) out.push_back(k);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void TaskRegistry::clear() {
    std::lock_guard lg(mtx_);
    tasks_.clear();
}
