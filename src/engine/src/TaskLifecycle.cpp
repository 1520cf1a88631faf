#include "TaskLifecycle.hpp"
#include "LogUtils.hpp"

#include <filesystem>

using Clock = std::chrono::steady_clock;

namespace {

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::string seconds_text(std::chrono::milliseconds duration) {
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(duration).count()) + "s";
}

}

const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::Pending:        return "pending";
        case TaskState::Spawning:       return "spawning";
        case TaskState::HealthChecking: return "health-checking";
        case TaskState::Stabilizing:    return "stabilizing";
        case TaskState::Dispatching:    return "dispatching";
        case TaskState::Polling:        return "polling";
        case TaskState::Verifying:      return "verifying";
        case TaskState::Completed:      return "completed";
        case TaskState::Failed:         return "failed";
    }
    return "unknown";
}

TaskLifecycle::TaskLifecycle(const LifecycleOptions& options,
                             WorkerLauncher& launcher,
                             RunningTaskRegistry& registry,
                             CancellationToken& cancel)
    : options_(options), launcher_(launcher), registry_(registry), cancel_(cancel) {}

void TaskLifecycle::transition(const std::string& task, TaskState state) {
    LogUtils::debug("Task {} -> {}", task, to_string(state));
    if (listener_) {
        listener_(task, state);
    }
}

void TaskLifecycle::pause(std::chrono::milliseconds interval, const std::string& task) {
    if (!cancel_.sleep_for(interval)) {
        throw TaskError(TaskErrorKind::Cancelled, "task " + task + " cancelled");
    }
}

ExecutionResult TaskLifecycle::execute(const TaskDefinition& task,
                                       const std::string& output_path,
                                       const std::string& payload) {
    const auto start = Clock::now();
    ExecutionResult result;
    result.task = task.name;

    transition(task.name, TaskState::Pending);

    std::shared_ptr<WorkerClient> worker;
    try {
        if (cancel_.is_cancelled()) {
            throw TaskError(TaskErrorKind::Cancelled, "task " + task.name + " cancelled before start");
        }

        transition(task.name, TaskState::Spawning);
        const int port = registry_.allocate_port();
        try {
            worker = launcher_.spawn(task.name, port);
        } catch (const std::exception& e) {
            throw TaskError(TaskErrorKind::Spawn, std::string("failed to spawn worker: ") + e.what());
        }
        registry_.add(RunningTask{task.name, port, worker, std::chrono::system_clock::now()});
        LogUtils::debug("Started task {} on port {}", task.name, port);

        transition(task.name, TaskState::HealthChecking);
        wait_for_healthy(*worker, task.name);

        transition(task.name, TaskState::Stabilizing);
        wait_for_stable(*worker, task.name);

        transition(task.name, TaskState::Dispatching);
        LogUtils::debug("Task {} is ready, sending payload", task.name);
        try {
            worker->dispatch(payload);
        } catch (const std::exception& e) {
            throw TaskError(TaskErrorKind::Dispatch, std::string("failed to send task: ") + e.what());
        }

        transition(task.name, TaskState::Polling);
        wait_for_completion(*worker, task.name);

        transition(task.name, TaskState::Verifying);
        std::error_code ec;
        if (!std::filesystem::exists(output_path, ec)) {
            throw TaskError(TaskErrorKind::OutputMissing,
                            "worker reported done but produced nothing: " + output_path);
        }

        result.output_path = output_path;
        transition(task.name, TaskState::Completed);
    } catch (const TaskError& e) {
        result.error = e;
    } catch (const std::exception& e) {
        result.error = TaskError(TaskErrorKind::Unknown, e.what());
    }

    if (worker) {
        // Nothing to do if the coordinator already stopped it during shutdown
        if (auto owned = registry_.remove(task.name)) {
            owned->stop();
        }
    }

    if (result.error) {
        LogUtils::debug("Task {} failed ({}): {}", task.name, to_string(result.error->kind()), result.error->what());
        transition(task.name, TaskState::Failed);
    }

    result.duration = elapsed_since(start);
    return result;
}

void TaskLifecycle::wait_for_healthy(WorkerClient& worker, const std::string& task) {
    const auto start = Clock::now();
    while (elapsed_since(start) < options_.health_timeout) {
        if (cancel_.is_cancelled()) {
            throw TaskError(TaskErrorKind::Cancelled, "task " + task + " cancelled");
        }
        if (worker.poll_status()) {
            return;
        }
        pause(options_.health_poll_interval, task);
    }
    throw TaskError(TaskErrorKind::HealthCheckTimeout,
                    "worker did not become healthy within " + seconds_text(options_.health_timeout));
}

void TaskLifecycle::wait_for_stable(WorkerClient& worker, const std::string& task) {
    const auto start = Clock::now();
    while (elapsed_since(start) < options_.stabilize_timeout) {
        if (cancel_.is_cancelled()) {
            throw TaskError(TaskErrorKind::Cancelled, "task " + task + " cancelled");
        }
        auto status = worker.poll_status();
        if (status && *status == WorkerStatus::Idle) {
            return;
        }
        pause(options_.health_poll_interval, task);
    }
    throw TaskError(TaskErrorKind::StabilizeTimeout,
                    "worker did not reach the idle state within " + seconds_text(options_.stabilize_timeout));
}

void TaskLifecycle::wait_for_completion(WorkerClient& worker, const std::string& task) {
    const auto start = Clock::now();
    auto last_progress_log = start;
    bool observed_running = false;
    int consecutive_poll_failures = 0;
    std::optional<WorkerStatus> last_status;

    while (true) {
        if (options_.completion_timeout.count() > 0 && elapsed_since(start) > options_.completion_timeout) {
            throw TaskError(TaskErrorKind::PollTimeout,
                            "timeout waiting for task to complete after " + seconds_text(options_.completion_timeout));
        }

        if (cancel_.is_cancelled()) {
            throw TaskError(TaskErrorKind::Cancelled, "task " + task + " cancelled");
        }

        auto status = worker.poll_status();
        if (!status) {
            consecutive_poll_failures++;
            if (consecutive_poll_failures >= options_.max_consecutive_poll_failures) {
                throw TaskError(TaskErrorKind::CrashDetected,
                                "worker unreachable after " + std::to_string(consecutive_poll_failures) +
                                " consecutive failures - process likely crashed");
            }
            if (consecutive_poll_failures % 10 == 0) {
                LogUtils::debug("Task {} status poll failed ({}/{})",
                                task, consecutive_poll_failures, options_.max_consecutive_poll_failures);
            }
            pause(options_.poll_interval, task);
            continue;
        }
        consecutive_poll_failures = 0;

        if (status != last_status) {
            LogUtils::debug("Task {} status: {} (elapsed: {})", task, to_string(*status), seconds_text(elapsed_since(start)));
            last_status = status;
        }

        if (*status == WorkerStatus::Busy) {
            observed_running = true;
        }

        // An idle answer before the worker ever picked the payload up is not completion
        if (observed_running && *status == WorkerStatus::Idle) {
            LogUtils::debug("Task {} completed in {}", task, seconds_text(elapsed_since(start)));
            return;
        }

        if (Clock::now() - last_progress_log > options_.progress_log_interval) {
            LogUtils::debug("Task {} still {}... (elapsed: {})", task, to_string(*status), seconds_text(elapsed_since(start)));
            last_progress_log = Clock::now();
        }

        pause(options_.poll_interval, task);
    }
}
