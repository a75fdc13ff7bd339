#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/timer_scheduler.hpp"
#include "scheduler/job_scheduler.hpp"
#include "task/task_registry.hpp"
#include "watcher/job_watcher.hpp"

namespace {

struct Submitted {
    std::string name;
    JobId       id;
};

// 第 i 个任务对应第 i 个 --params，缺省为 {}
std::vector<nlohmann::json> parseParams(const std::vector<std::string>& raw, std::size_t count) {
    std::vector<nlohmann::json> out(count, nlohmann::json::object());
    for (std::size_t i = 0; i < raw.size() && i < count; ++i) {
        out[i] = nlohmann::json::parse(raw[i]);
    }
    return out;
}

void onLifecycle(JobEvent ev, const JobRecord& record) {
    spdlog::info("Main: job {} {} (status={})", record.id.str(), to_string(ev), to_string(record.status));
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("jobpilot", "In-process background job scheduler");
    options.add_options()
        ("h,help", "Show help")
        ("c,config", "Configuration file path", cxxopts::value<std::string>()->default_value("config.yaml"))
        ("t,task", "Task to run (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("p,params", "JSON params for the task at the same position", cxxopts::value<std::vector<std::string>>())
        ("j,max-concurrency", "Override scheduler_config.max_concurrency", cxxopts::value<int>())
        ("w,watch", "Stream job status events to stdout")
        ("timeout", "Seconds to wait for each job", cxxopts::value<double>())
        ("l,list", "List registered tasks");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 2;
    }
    if (result.count("help") || argc < 2) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    auto& tasks = TaskRegistry::instance();
    registerBuiltinTasks(tasks);

    if (result.count("list")) {
        for (const auto& name : tasks.list()) std::cout << name << "\n";
        return 0;
    }

    auto configPath = result["config"].as<std::string>();
    std::optional<Config>     config;
    SchedulerOptions          schedulerOptions;
    std::chrono::milliseconds pollInterval = JobWatcher::kDefaultPollInterval;
    try {
        if (std::filesystem::exists(configPath)) {
            config.emplace(Config::instance(configPath));
        } else {
            spdlog::warn("Main: config file {} not found, using defaults", configPath);
            config.emplace(Config::fromString("{}"));
        }
        initLogging(*config);

        schedulerOptions = SchedulerOptions::fromConfig(*config);
        config->unknownKeys("watcher_config", {"poll_interval_ms"});
        pollInterval = std::chrono::milliseconds(
            config->getOr<int>("watcher_config", "poll_interval_ms",
                               static_cast<int>(JobWatcher::kDefaultPollInterval.count())));
    } catch (const std::exception& e) {
        spdlog::critical("Main: {}", e.what());
        return 2;
    }
    if (result.count("max-concurrency")) {
        schedulerOptions.maxConcurrency = result["max-concurrency"].as<int>();
    }

    std::vector<std::string> taskNames;
    if (result.count("task")) taskNames = result["task"].as<std::vector<std::string>>();
    if (taskNames.empty()) {
        std::cerr << "No task given. Use --task <name>, see --list." << std::endl;
        return 2;
    }

    std::vector<nlohmann::json> params;
    try {
        std::vector<std::string> rawParams;
        if (result.count("params")) rawParams = result["params"].as<std::vector<std::string>>();
        params = parseParams(rawParams, taskNames.size());
    } catch (const nlohmann::json::exception& e) {
        spdlog::critical("Main: invalid --params: {}", e.what());
        return 2;
    }

    std::optional<std::chrono::milliseconds> timeout;
    if (result.count("timeout")) {
        timeout = std::chrono::milliseconds(static_cast<long long>(result["timeout"].as<double>() * 1000));
    }

    // outMtx 要比 watcher 活得久
    std::mutex   outMtx;
    JobScheduler scheduler(schedulerOptions);
    scheduler.addLifecycleCb(onLifecycle);

    TimerScheduler timers(1);
    JobWatcher     watcher(scheduler, timers);

    std::vector<Submitted> submitted;
    for (std::size_t i = 0; i < taskNames.size(); ++i) {
        try {
            auto fn = tasks.get(taskNames[i]);
            auto id = scheduler.addJob(fn, params[i]);
            submitted.push_back({taskNames[i], id});
            if (result.count("watch")) {
                watcher.watch(id, [&outMtx](const std::string& event) {
                    std::lock_guard lg(outMtx);
                    std::cout << event << std::flush;
                }, pollInterval);
            }
        } catch (const SchedulerError& e) {
            spdlog::error("Main: cannot submit task '{}': {}", taskNames[i], e.what());
            return 2;
        }
    }

    int exitCode = 0;
    for (const auto& job : submitted) {
        try {
            scheduler.wait(job.id, timeout);
        } catch (const SchedulerError& e) {
            spdlog::error("Main: task '{}' ({}): {}", job.name, job.id.str(), e.what());
            exitCode = 1;
        }
    }

    // 等 watcher 推送完终态事件
    while (watcher.activeWatches() > 0 && exitCode == 0) {
        std::this_thread::sleep_for(pollInterval / 4);
    }

    nlohmann::json summary = nlohmann::json::array();
    for (const auto& job : submitted) {
        auto record = scheduler.getRecord(job.id);
        nlohmann::json entry = record;
        entry["task"] = job.name;
        if (record.status == JobStatus::Completed) {
            entry["result"] = scheduler.getResult<nlohmann::json>(job.id);
        } else {
            exitCode = 1;
        }
        summary.push_back(std::move(entry));
    }
    {
        std::lock_guard lg(outMtx);
        std::cout << summary.dump(2) << std::endl;
    }
    return exitCode;
}
