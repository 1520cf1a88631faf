#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "CancellationToken.hpp"
#include "ExecutionResult.hpp"
#include "RunningTaskRegistry.hpp"
#include "TaskDefinition.hpp"
#include "WorkerClient.hpp"

enum class TaskState {
    Pending,
    Spawning,
    HealthChecking,
    Stabilizing,
    Dispatching,
    Polling,
    Verifying,
    Completed,
    Failed
};

const char* to_string(TaskState state);

struct LifecycleOptions {
    std::chrono::milliseconds health_timeout{std::chrono::minutes(2)};
    std::chrono::milliseconds health_poll_interval{500};
    std::chrono::milliseconds stabilize_timeout{std::chrono::minutes(2)};
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds completion_timeout{0};   // 0 = poll until completion
    int max_consecutive_poll_failures = 30;
    std::chrono::milliseconds progress_log_interval{std::chrono::seconds(30)};
};

// Drives one task's worker from spawn to verified output. Every failure ends up in the
// returned ExecutionResult; the worker is stopped and unregistered exactly once.
class TaskLifecycle {
public:
    using StateListener = std::function<void(const std::string& task, TaskState state)>;

    TaskLifecycle(const LifecycleOptions& options,
                  WorkerLauncher& launcher,
                  RunningTaskRegistry& registry,
                  CancellationToken& cancel);

    ExecutionResult execute(const TaskDefinition& task,
                            const std::string& output_path,
                            const std::string& payload);

    void set_state_listener(StateListener listener) { listener_ = std::move(listener); }

    // Phases, each throws TaskError
    void wait_for_healthy(WorkerClient& worker, const std::string& task);
    void wait_for_stable(WorkerClient& worker, const std::string& task);
    void wait_for_completion(WorkerClient& worker, const std::string& task);

private:
    void transition(const std::string& task, TaskState state);
    void pause(std::chrono::milliseconds interval, const std::string& task);

    LifecycleOptions options_;
    WorkerLauncher& launcher_;
    RunningTaskRegistry& registry_;
    CancellationToken& cancel_;
    StateListener listener_;
};
