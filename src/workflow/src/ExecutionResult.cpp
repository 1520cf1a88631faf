#include "ExecutionResult.hpp"
#include "ConfigData.hpp"
#include <algorithm>

const char* to_string(CacheMode mode) {
    switch (mode) {
        case CacheMode::Normal: return "normal";
        case CacheMode::Resume: return "resume";
        case CacheMode::Force:  return "force";
    }
    return "normal";
}

const char* to_string(TaskErrorKind kind) {
    switch (kind) {
        case TaskErrorKind::Spawn:              return "spawn";
        case TaskErrorKind::HealthCheckTimeout: return "health-check-timeout";
        case TaskErrorKind::StabilizeTimeout:   return "stabilize-timeout";
        case TaskErrorKind::Dispatch:           return "dispatch";
        case TaskErrorKind::PollTimeout:        return "poll-timeout";
        case TaskErrorKind::CrashDetected:      return "crash-detected";
        case TaskErrorKind::OutputMissing:      return "output-missing";
        case TaskErrorKind::Cancelled:          return "cancelled";
        case TaskErrorKind::Unknown:            return "unknown";
    }
    return "unknown";
}

size_t RunReport::succeeded() const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [](const ExecutionResult& r) { return r.ok(); }));
}

size_t RunReport::failed() const {
    return results.size() - succeeded();
}
