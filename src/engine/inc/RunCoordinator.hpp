#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "CancellationToken.hpp"
#include "ConfigData.hpp"
#include "DependencyScheduler.hpp"
#include "ExecutionResult.hpp"
#include "PayloadRenderer.hpp"
#include "ResumeStateManager.hpp"
#include "RunContext.hpp"
#include "RunningTaskRegistry.hpp"
#include "TaskLifecycle.hpp"
#include "WorkerClient.hpp"

struct RunRequest {
    std::vector<std::string> tasks;          // Empty = every registered task
    bool sequential = false;
    CacheMode cache_mode = CacheMode::Normal;
    std::chrono::seconds timeout{0};         // Per task completion timeout, 0 = none
    std::string output_dir = "./outputs";
};

struct CoordinatorOptions {
    LifecycleOptions lifecycle;
    int base_port = 3284;
    std::string running_state_file = RunningTaskRegistry::default_state_file();
};

// Runs a dependency-expanded task set either one task at a time or one level at a time,
// consulting and updating the resume state around every task.
class RunCoordinator {
public:
    RunCoordinator(TaskRegistry tasks,
                   const CoordinatorOptions& options,
                   WorkerLauncher& launcher,
                   PayloadRenderer& renderer,
                   CancellationToken& cancel);

    // Throws ConfigurationError (unknown task, cycle, unreadable inputs) before any task runs.
    // Task failures are reported in the returned RunReport.
    RunReport run(const RunRequest& request, const RunContext& context);

    // Tasks the request resolves to, dependencies included, in execution order
    std::vector<std::string> plan(const std::vector<std::string>& requested) const;

    const DependencyScheduler& scheduler() const { return scheduler_; }
    const RunningTaskRegistry& running_tasks() const { return running_; }

    static void log_summary(const RunReport& report);

private:
    RunReport run_sequential(const std::vector<std::string>& tasks);
    RunReport run_parallel(const DependencyLevels& levels);

    ExecutionResult run_task(const std::string& name);
    ExecutionResult check_and_run(const std::string& name);
    static void log_result(const ExecutionResult& result);

    TaskRegistry tasks_;
    DependencyScheduler scheduler_;
    CoordinatorOptions options_;
    WorkerLauncher& launcher_;
    PayloadRenderer& renderer_;
    CancellationToken& cancel_;
    RunningTaskRegistry running_;

    // Per-run state
    RunRequest request_;
    RunContext context_;
    std::unique_ptr<ResumeStateManager> state_;
    std::unique_ptr<TaskLifecycle> lifecycle_;
};
