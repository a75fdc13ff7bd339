#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "scheduler/job_id.hpp"

enum class JobStatus : std::uint8_t {
    Pending,
    Running,
    Completed,
    Failed,
    Canceled
};

const char* to_string(JobStatus status);
std::optional<JobStatus> jobStatusFromString(std::string_view text);

// completed / failed / canceled 均为终态
inline bool isTerminal(JobStatus status) {
    return status == JobStatus::Completed
        || status == JobStatus::Failed
        || status == JobStatus::Canceled;
}

// pending -> running -> 终态；pending 也可直接取消
bool canTransition(JobStatus from, JobStatus to);

using JobClock     = std::chrono::system_clock;
using JobTimePoint = JobClock::time_point;

struct JobRecord {
    JobId                       id;
    JobStatus                   status{JobStatus::Pending};
    JobTimePoint                submitted_at{};
    std::optional<JobTimePoint> started_at;
    std::optional<JobTimePoint> finished_at;
    std::optional<std::string>  error;            // 异常类型 + 消息
    std::optional<std::string>  error_traceback;  // 完整诊断信息
    std::optional<JobId>        artifact_id;      // 作业返回值本身是 JobId 时记录
};

// ISO-8601 UTC，毫秒精度，例如 2025-01-01T08:00:00.123Z
std::string formatTimestamp(JobTimePoint tp);

void to_json(nlohmann::json& j, JobStatus status);
void from_json(const nlohmann::json& j, JobStatus& status);
void to_json(nlohmann::json& j, const JobRecord& record);
