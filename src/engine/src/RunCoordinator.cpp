#include "RunCoordinator.hpp"
#include "Latch.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"

#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds kBarrierCheckInterval{100};

std::string duration_text(std::chrono::milliseconds duration) {
    return fmt::format("{:.1f}s", duration.count() / 1000.0);
}

}

RunCoordinator::RunCoordinator(TaskRegistry tasks,
                               const CoordinatorOptions& options,
                               WorkerLauncher& launcher,
                               PayloadRenderer& renderer,
                               CancellationToken& cancel)
    : tasks_(std::move(tasks)),
      scheduler_(tasks_),
      options_(options),
      launcher_(launcher),
      renderer_(renderer),
      cancel_(cancel),
      running_(options.base_port, options.running_state_file) {}

std::vector<std::string> RunCoordinator::plan(const std::vector<std::string>& requested) const {
    std::vector<std::string> names = requested.empty() ? scheduler_.task_names() : requested;
    scheduler_.validate_names(names);
    return scheduler_.expand_with_dependencies(names);
}

RunReport RunCoordinator::run(const RunRequest& request, const RunContext& context) {
    const std::vector<std::string> tasks = plan(request.tasks);
    const DependencyLevels levels = scheduler_.dependency_levels(tasks);

    request_ = request;
    context_ = context;
    context_.output_dir = request.output_dir;

    std::error_code ec;
    fs::create_directories(request.output_dir, ec);
    if (ec) {
        throw ConfigurationError("Failed to create output directory " + request.output_dir + ": " + ec.message());
    }

    state_ = std::make_unique<ResumeStateManager>(request.output_dir);
    if (request.cache_mode == CacheMode::Force) {
        LogUtils::info("Force mode: discarding recorded outputs");
        state_->clear();
    } else {
        state_->load();
    }

    try {
        state_->update_input_hash(context.input_files, context.input_root);
    } catch (const std::exception& e) {
        throw ConfigurationError(std::string("Failed to hash input files: ") + e.what());
    }
    state_->update_config_hash(context.profile);

    LifecycleOptions lifecycle = options_.lifecycle;
    lifecycle.completion_timeout = request.timeout;
    lifecycle_ = std::make_unique<TaskLifecycle>(lifecycle, launcher_, running_, cancel_);

    LogUtils::info("Tasks: {}", StringUtils::join(tasks, ", "));
    LogUtils::info("Execution: {}, cache mode: {}", request.sequential ? "sequential" : "parallel",
                   to_string(request.cache_mode));

    RunReport report = request.sequential ? run_sequential(tasks) : run_parallel(levels);

    if (cancel_.is_cancelled()) {
        report.cancelled = true;
        report.success = false;
        if (report.failure.empty()) {
            report.failure = "run cancelled";
        }
        running_.stop_all();
    }

    state_->save();
    running_.clear_state_file();
    return report;
}

RunReport RunCoordinator::run_sequential(const std::vector<std::string>& tasks) {
    RunReport report;
    report.results.reserve(tasks.size());

    for (const auto& name : tasks) {
        if (cancel_.is_cancelled()) {
            break;
        }

        ExecutionResult result = check_and_run(name);
        log_result(result);
        report.results.push_back(result);

        if (!result.ok()) {
            LogUtils::error("Task {} failed, stopping sequential execution", name);
            report.success = false;
            report.failure = "task " + name + " failed: " + result.error->what();
            return report;
        }
    }

    return report;
}

RunReport RunCoordinator::run_parallel(const DependencyLevels& levels) {
    RunReport report;

    for (size_t level_idx = 0; level_idx < levels.size(); ++level_idx) {
        const auto& level = levels[level_idx];
        if (level.empty()) {
            continue;
        }
        if (cancel_.is_cancelled()) {
            break;
        }

        LogUtils::debug("Running level {}: {}", level_idx + 1, StringUtils::join(level, ", "));

        std::vector<ExecutionResult> level_results(level.size());
        Latch latch(level.size());
        std::vector<std::thread> workers;
        workers.reserve(level.size());
        for (size_t i = 0; i < level.size(); ++i) {
            workers.emplace_back([this, &level, &level_results, &latch, i] {
                level_results[i] = check_and_run(level[i]);
                latch.count_down();
            });
        }

        // Barrier; on cancellation stop every live worker so blocked tasks return quickly
        while (!latch.wait_for(kBarrierCheckInterval, [this] { return cancel_.is_cancelled(); })) {
            if (cancel_.is_cancelled()) {
                LogUtils::warn("Cancellation requested, stopping {} unfinished task(s) of level {}",
                               latch.pending(), level_idx + 1);
                running_.stop_all();
                latch.wait();
                break;
            }
        }
        for (auto& worker : workers) {
            if (worker.joinable()) worker.join();
        }

        bool level_failed = false;
        for (auto& result : level_results) {
            log_result(result);
            if (!result.ok()) {
                level_failed = true;
            }
            report.results.push_back(std::move(result));
        }

        if (cancel_.is_cancelled()) {
            break;
        }

        if (level_failed) {
            LogUtils::error("Level {} had failures, stopping execution", level_idx + 1);
            report.success = false;
            report.failure = "tasks in level " + std::to_string(level_idx + 1) + " failed";
            return report;
        }
    }

    return report;
}

ExecutionResult RunCoordinator::check_and_run(const std::string& name) {
    try {
        return run_task(name);
    } catch (const std::exception& e) {
        ExecutionResult result;
        result.task = name;
        result.error = TaskError(TaskErrorKind::Unknown, e.what());
        return result;
    }
}

ExecutionResult RunCoordinator::run_task(const std::string& name) {
    const TaskDefinition& task = tasks_.at(name);
    const std::string output_path = fs::absolute(fs::path(request_.output_dir) / task.output).lexically_normal().string();

    std::string reason = "regeneration requested";
    if (request_.cache_mode == CacheMode::Resume) {
        RegenerationDecision decision = state_->should_regenerate(name, output_path, task.depends_on);
        if (!decision.regenerate) {
            ExecutionResult result;
            result.task = name;
            result.output_path = output_path;
            result.skipped = true;
            result.reason = decision.reason;
            return result;
        }
        reason = decision.reason;
        LogUtils::info("Running {}: {}", name, reason);
    } else {
        LogUtils::info("Running {}", name);
    }

    std::error_code ec;
    fs::create_directories(fs::path(output_path).parent_path(), ec);

    std::string payload;
    try {
        payload = renderer_.render(task, output_path, context_);
    } catch (const std::exception& e) {
        ExecutionResult result;
        result.task = name;
        result.reason = reason;
        result.error = TaskError(TaskErrorKind::Dispatch, std::string("failed to render payload: ") + e.what());
        return result;
    }

    ExecutionResult result = lifecycle_->execute(task, output_path, payload);
    result.reason = reason;

    if (result.ok()) {
        try {
            state_->record_output(name, output_path, task.depends_on);
            state_->save();
        } catch (const std::exception& e) {
            LogUtils::warn("Failed to record output of {}: {}", name, e.what());
        }
    }
    return result;
}

void RunCoordinator::log_result(const ExecutionResult& result) {
    if (!result.ok()) {
        LogUtils::error("FAIL {}: {} ({})", result.task, result.error->what(), duration_text(result.duration));
    } else if (result.skipped) {
        LogUtils::info("SKIP {}: {}", result.task, result.reason);
    } else {
        LogUtils::info("OK   {} -> {} ({})", result.task, result.output_path, duration_text(result.duration));
    }
}

void RunCoordinator::log_summary(const RunReport& report) {
    LogUtils::info("=== Summary ===");
    LogUtils::info("{}/{} tasks succeeded", report.succeeded(), report.results.size());
    if (report.failed() > 0 || !report.success) {
        LogUtils::info("Partial results saved.");
    }
    if (report.cancelled) {
        LogUtils::warn("Run was interrupted");
    }
}
