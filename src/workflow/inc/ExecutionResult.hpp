#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "TaskError.hpp"

struct ExecutionResult {
    std::string task;
    std::string output_path;
    std::optional<TaskError> error;
    std::chrono::milliseconds duration{0};
    bool skipped = false;      // Judged up-to-date, worker never started
    std::string reason;        // Cache decision behind the run or skip

    bool ok() const { return !error.has_value(); }
};

struct RunReport {
    std::vector<ExecutionResult> results;
    bool success = true;
    bool cancelled = false;
    std::string failure;       // Why the run stopped early, empty on success

    size_t succeeded() const;
    size_t failed() const;
};
