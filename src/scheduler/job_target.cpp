#include "scheduler/job_target.hpp"

const char* to_string(TargetKind kind) {
    switch (kind) {
        case TargetKind::Callable:      return "callable";
        case TargetKind::AsyncCallable: return "async-callable";
        case TargetKind::Deferred:      return "deferred";
    }
    return "unknown";
}
