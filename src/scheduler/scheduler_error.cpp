#include "scheduler/scheduler_error.hpp"

const char* to_string(SchedulerErrc code) {
    switch (code) {
        case SchedulerErrc::NotFound:         return "not-found";
        case SchedulerErrc::InvalidArgument:  return "invalid-argument";
        case SchedulerErrc::AlreadyScheduled: return "already-scheduled";
        case SchedulerErrc::NotFinished:      return "not-finished";
        case SchedulerErrc::Timeout:          return "timeout";
        case SchedulerErrc::JobFailure:       return "job-failure";
    }
    return "unknown";
}

SchedulerError::SchedulerError(SchedulerErrc code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

JobFailureError::JobFailureError(std::string error, std::string traceback)
    : SchedulerError(SchedulerErrc::JobFailure, error),
      error_(std::move(error)),
      traceback_(std::move(traceback)) {}
