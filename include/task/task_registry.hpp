// task_registry.hpp
#pragma once
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "scheduler/cancel_token.hpp"
#include "scheduler/job_target.hpp"

// 具名任务函数：作业令牌 + JSON 参数
using TaskFunc = std::function<JobResult(const CancelToken&, const nlohmann::json& params)>;

class TaskRegistry {
public:
    // 单例（可选）；也可 main() 手动构造
    static TaskRegistry& instance();

    TaskRegistry() = default;
    TaskRegistry(const TaskRegistry&)            = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    // 重名抛 std::invalid_argument
    void registerTask(std::string name, TaskFunc fn);

    // 未注册抛 SchedulerError(NotFound)
    TaskFunc get(const std::string& name) const;

    bool contains(const std::string& name) const;

    // 按名称排序
    std::vector<std::string> list() const;

    void clear();

private:
    mutable std::mutex                        mtx_;
    std::unordered_map<std::string, TaskFunc> tasks_;
};

template <typename F>
struct AutoRegTask {
    AutoRegTask(const char* name, F fn) {
        TaskRegistry::instance().registerTask(name, std::move(fn));
    }
};

// 注册内置任务：sleep / fail / sum / echo
void registerBuiltinTasks(TaskRegistry& registry);
