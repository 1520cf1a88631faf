#pragma once

#include <stdexcept>
#include <string>

// Fatal problems detected before any task runs: cycles, unknown names, bad options.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

enum class TaskErrorKind {
    Spawn,
    HealthCheckTimeout,
    StabilizeTimeout,
    Dispatch,
    PollTimeout,
    CrashDetected,
    OutputMissing,
    Cancelled,
    Unknown
};

const char* to_string(TaskErrorKind kind);

// Failure of a single task. Recorded in its ExecutionResult, never escapes the run.
class TaskError : public std::runtime_error {
public:
    TaskError(TaskErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    TaskErrorKind kind() const { return kind_; }

private:
    TaskErrorKind kind_;
};
