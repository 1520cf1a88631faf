#include "LogUtils.hpp"
#include "SignalManager.hpp"
#include "ParameterContext.hpp"
#include "InputDiscovery.hpp"
#include "AgentApiWorker.hpp"
#include "PayloadRenderer.hpp"
#include "StringUtils.hpp"
#include "RunCoordinator.hpp"
#include <iostream>
#include <csignal>

namespace {

constexpr int EXIT_INTERRUPTED = 130;

int show_status() {
    std::map<std::string, int> running;
    try {
        running = RunningTaskRegistry::load_state();
    } catch (const std::exception& e) {
        LogUtils::debug("No running state: {}", e.what());
    }

    if (running.empty()) {
        std::cout << "No tasks currently running" << std::endl;
        return 0;
    }

    std::cout << "Running tasks:" << std::endl;
    for (const auto& [name, port] : running) {
        AgentApiWorker probe(port, -1, std::chrono::seconds(2));
        const auto status = probe.status_text();
        std::cout << "  " << name << " (port " << port << "): "
                  << status.value_or("not responding") << std::endl;
    }
    return 0;
}

CoordinatorOptions make_coordinator_options(const ConfigData& config) {
    CoordinatorOptions options;
    options.base_port = config.worker.base_port;
    options.lifecycle.health_timeout = config.worker.health_timeout;
    options.lifecycle.health_poll_interval = config.worker.health_poll_interval;
    options.lifecycle.poll_interval = config.worker.poll_interval;
    options.lifecycle.max_consecutive_poll_failures = config.worker.max_poll_failures;
    return options;
}

int run_pipeline(const ConfigData& config) {
    const InputSet inputs = InputDiscovery::discover(config.run.input_path);
    LogUtils::info(inputs.summary());

    RunContext context;
    context.input_root = inputs.root();
    context.primary_file = inputs.primary_file;
    context.input_files = inputs.files;
    context.output_dir = config.global.output_dir;
    context.profile = config.profile;

    RunRequest request;
    request.tasks = config.run.tasks;
    request.sequential = config.run.sequential;
    request.cache_mode = config.run.cache_mode;
    request.timeout = config.global.timeout;
    request.output_dir = config.global.output_dir;

    CancellationToken cancel;
    SignalManager::register_signal(SIGINT, [&cancel](int signum) {
        LogUtils::warn("Interrupt signal ({}) received, stopping running tasks...", signum);
        cancel.cancel();
    });
    SignalManager::register_signal(SIGTERM, [&cancel](int signum) {
        LogUtils::warn("Termination signal ({}) received, stopping running tasks...", signum);
        cancel.cancel();
    });
    SignalManager::setup();
    // Callbacks reference the local token; drop them on every exit path
    struct SignalReset {
        ~SignalReset() { SignalManager::reset(); }
    } signal_reset;

    AgentApiLauncher launcher(config.worker.command, config.global.verbose);
    TemplatePayloadRenderer renderer(config.tasks);
    RunCoordinator coordinator(config.tasks, make_coordinator_options(config), launcher, renderer, cancel);

    LogUtils::info("Running {} in {} mode (cache: {})",
                   request.tasks.empty() ? std::string("all tasks") : StringUtils::join(request.tasks, ", "),
                   request.sequential ? "sequential" : "parallel",
                   to_string(request.cache_mode));

    const RunReport report = coordinator.run(request, context);
    RunCoordinator::log_summary(report);

    if (report.cancelled) {
        return EXIT_INTERRUPTED;
    }
    return report.success ? 0 : 1;
}

}

int main(int argc, char* argv[]) {
    int result = 0;

    LogUtils::init(LogUtils::Level::Info);

    try {
        ParameterContext context;

        if (!context.init(argc, argv)) {
            LogUtils::shutdown();
            return 0;
        }

        if (context.get_global_config().verbose) {
            LogUtils::set_level(LogUtils::Level::Debug);
        }

        const ConfigData& config = context.get_config_data();
        if (config.run.status_only) {
            result = show_status();
        } else {
            result = run_pipeline(config);
        }
    } catch (const ConfigurationError& e) {
        LogUtils::error("Configuration error: {}", e.what());
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        result = 1;
    }

    LogUtils::shutdown();
    return result;
}
