#include "scheduler/job_record.hpp"

#include <stdexcept>

#include <date/date.h>

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Canceled:  return "canceled";
    }
    return "unknown";
}

std::optional<JobStatus> jobStatusFromString(std::string_view text) {
    for (auto s : {JobStatus::Pending, JobStatus::Running, JobStatus::Completed,
                   JobStatus::Failed, JobStatus::Canceled}) {
        if (text == to_string(s)) return s;
    }
    return std::nullopt;
}

bool canTransition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::Pending:
            return to == JobStatus::Running || to == JobStatus::Canceled;
        case JobStatus::Running:
            return isTerminal(to);
        default:
            return false;
    }
}

std::string formatTimestamp(JobTimePoint tp) {
    return date::format("%FT%TZ", date::floor<std::chrono::milliseconds>(tp));
}

void to_json(nlohmann::json& j, JobStatus status) {
    j = to_string(status);
}

void from_json(const nlohmann::json& j, JobStatus& status) {
    auto parsed = jobStatusFromString(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("unknown job status: " + j.get<std::string>());
    }
    status = *parsed;
}

namespace {

template <typename T, typename F>
nlohmann::json optionalToJson(const std::optional<T>& v, F&& conv) {
    if (!v) return nullptr;
    return conv(*v);
}

} // namespace

void to_json(nlohmann::json& j, const JobRecord& record) {
    auto ts  = [](JobTimePoint tp) { return formatTimestamp(tp); };
    auto str = [](const std::string& s) { return s; };
    auto id  = [](const JobId& v) { return v.str(); };

    j = nlohmann::json{
        {"id",              record.id.str()},
        {"status",          record.status},
        {"submitted_at",    formatTimestamp(record.submitted_at)},
        {"started_at",      optionalToJson(record.started_at, ts)},
        {"finished_at",     optionalToJson(record.finished_at, ts)},
        {"error",           optionalToJson(record.error, str)},
        {"error_traceback", optionalToJson(record.error_traceback, str)},
        {"artifact_id",     optionalToJson(record.artifact_id, id)},
    };
}
