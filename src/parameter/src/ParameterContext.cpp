#include "ParameterContext.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace {

// Accepts "90", "90s", "30m" or "2h"
std::chrono::seconds parse_duration(const std::string& text, const std::string& context) {
    std::string value = text;
    StringUtils::trim(value);
    if (value.empty()) {
        throw ConfigurationError("Empty duration for " + context);
    }

    long multiplier = 1;
    const char unit = value.back();
    if (unit == 's' || unit == 'm' || unit == 'h') {
        multiplier = unit == 'h' ? 3600 : (unit == 'm' ? 60 : 1);
        value.pop_back();
    }

    long amount = 0;
    try {
        size_t consumed = 0;
        amount = std::stol(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid duration for " + context + ": " + text);
    }
    if (amount < 0) {
        throw ConfigurationError("Negative duration for " + context + ": " + text);
    }
    return std::chrono::seconds(amount * multiplier);
}

}

ParameterContext::ParameterContext() {
    load_default_config();
}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify config file path", true},
    {"--tasks", 'a', "Comma-separated tasks to run (dependencies are added)", true},
    {"--output", 'o', "Output directory for generated artifacts", true},
    {"--sequential", 's', "Run tasks one at a time in dependency order", false},
    {"--timeout", 't', "Per-task completion timeout (e.g. 900, 30m, 2h; 0 = none)", true},
    {"--resume", 'r', "Skip tasks whose outputs are still up to date", false},
    {"--force", 'f', "Discard resume state and regenerate everything (overrides --resume)", false},
    {"--persona", 'p', "Project persona: minimal, balanced or production", true},
    {"--status", 'S', "Show tasks of a run in progress and exit", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

const std::vector<std::string>& ParameterContext::valid_personas() {
    static const std::vector<std::string> personas = {"minimal", "balanced", "production"};
    return personas;
}

void ParameterContext::show_help() {
    std::cout << "Usage: agentpipe [OPTIONS]... <input>\n\n"
              << "  <input>  A requirements file or a directory of input documents\n\n"
              << "Options:\n";

    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nExamples:\n"
              << "  agentpipe ./docs/prd.md\n"
              << "  agentpipe --tasks=verifier --resume ./docs\n"
              << "  agentpipe -c pipeline.yaml -s -t 30m ./docs\n\n";
}

void ParameterContext::show_version() {
    std::cout << "agentpipe version: 0.3.0" << std::endl;
    std::cout << "git: " << AGENTPIPE_BUILD_GIT << std::endl;
    std::cout << "build: " << AGENTPIPE_BUILD_TARGET_OSTYPE << "-" << AGENTPIPE_BUILD_TARGET_CPUTYPE << " " << AGENTPIPE_BUILD_DATE << std::endl;
}

void ParameterContext::parse_global(const YAML::Node& config) {
    auto& global_config = config_data.global;
    if (config["verbose"]) {
        global_config.verbose = config["verbose"].as<bool>();
    }
    if (config["log_dir"]) {
        global_config.log_dir = config["log_dir"].as<std::string>();
    }
    if (config["output_dir"]) {
        global_config.output_dir = config["output_dir"].as<std::string>();
    }
    if (config["timeout"]) {
        global_config.timeout = parse_duration(config["timeout"].as<std::string>(), "timeout");
    }
    if (config["worker"]) {
        WorkerConfig worker = config_data.worker;
        YAML::convert<WorkerConfig>::decode(config["worker"], worker);
        config_data.worker = worker;
    }
}

// Stack and preference entries override defaults key by key
void ParameterContext::parse_profile(const YAML::Node& config) {
    auto& profile = config_data.profile;
    if (config["persona"]) {
        profile.persona = StringUtils::to_lower(config["persona"].as<std::string>());
    }
    if (config["stack"]) {
        for (const auto& [key, value] : YAML::as_string_map(config["stack"], "stack")) {
            profile.stack[key] = value;
        }
    }
    if (config["preferences"]) {
        for (const auto& [key, value] : YAML::as_string_map(config["preferences"], "preferences")) {
            profile.preferences[key] = value;
        }
    }
}

void ParameterContext::parse_tasks(const YAML::Node& tasks_yaml) {
    if (!tasks_yaml.IsMap()) {
        throw ConfigurationError("Expected a mapping for tasks");
    }

    TaskRegistry tasks;
    for (const auto& task_node : tasks_yaml) {
        TaskDefinition task = task_node.second.as<TaskDefinition>();
        task.name = task_node.first.as<std::string>();
        if (task.name.empty()) {
            throw ConfigurationError("Task name must not be empty");
        }
        tasks[task.name] = std::move(task);
    }

    if (tasks.empty()) {
        throw ConfigurationError("At least one task must be defined");
    }
    config_data.tasks = std::move(tasks);
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    static const std::set<std::string> valid_keys = {
        "verbose", "log_dir", "output_dir", "timeout", "persona",
        "stack", "preferences", "worker", "tasks"
    };
    if (config.IsNull()) {
        return;
    }
    YAML::check_unknown_keys(config, valid_keys, "root");

    parse_global(config);
    parse_profile(config);

    // A configured task list replaces the built-in one
    if (config["tasks"]) {
        parse_tasks(config["tasks"]);
    }
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const ConfigurationError& e) {
        throw ConfigurationError("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    if (cli_params.count("--config-file")) {
        const std::string& config_file = cli_params["--config-file"];
        if (!std::filesystem::exists(config_file)) {
            throw ConfigurationError("Config file not found: " + config_file);
        }
        merge_yaml(config_file);
        return;
    }

    std::string config_file = find_config_file();
    if (!config_file.empty()) {
        merge_yaml(config_file);
    }
}

std::string ParameterContext::find_config_file() const {
    std::vector<std::string> candidates = {
        ".agentpipe/config.yaml",
        ".agentpipe/config.yml"
    };
    if (const char* home = std::getenv("HOME")) {
        candidates.push_back(std::string(home) + "/.agentpipe/config.yaml");
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return "";
}

void ParameterContext::load_default_config() {
    YAML::Node config = YAML::Load(R"(
output_dir: ./outputs
timeout: 0
persona: balanced

stack:
  cloud: aws
  compute: kubernetes
  database: postgres
  cache: redis
  iac: terraform
  gitops: argocd
  ci: github-actions
  monitoring: prometheus
  logging: stdout

preferences:
  stateless: false
  api_style: rest
  language: go
  testing_depth: unit
  documentation_level: standard
  dependency_style: minimal
  error_handling: structured
  containerized: true
  include_ci: true
  include_iac: true

tasks:
  architect:
    output: architecture.md
  qa:
    output: test-plan.md
    depends_on: [architect]
  security:
    output: security-assessment.md
    depends_on: [architect]
  implementer:
    output: code/.complete
    depends_on: [architect, security]
  verifier:
    output: code/.verified
    depends_on: [implementer, qa]
)");

    merge_yaml(config);
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Long option format (--key=value or --key value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw ConfigurationError("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    if (i + 1 >= argc) {
                        throw ConfigurationError("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw ConfigurationError("Option does not take a value: " + key);
            }

            cli_params[key] = value;
        }
        // Short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw ConfigurationError("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw ConfigurationError("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw ConfigurationError("Option requires a value: " + key);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        }
        else {
            positional_args.push_back(arg);
        }
    }

    if (positional_args.size() > 1) {
        throw ConfigurationError("Only one input path may be given, got " + std::to_string(positional_args.size()));
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& global_config = config_data.global;
    auto& run = config_data.run;

    if (cli_params.count("--verbose")) {
        global_config.verbose = true;
    }
    if (cli_params.count("--output")) {
        global_config.output_dir = cli_params["--output"];
    }
    if (cli_params.count("--timeout")) {
        global_config.timeout = parse_duration(cli_params["--timeout"], "--timeout");
    }
    if (cli_params.count("--persona")) {
        config_data.profile.persona = StringUtils::to_lower(cli_params["--persona"]);
    }
    if (cli_params.count("--tasks")) {
        run.tasks = StringUtils::split(cli_params["--tasks"], ',');
        if (run.tasks.empty()) {
            throw ConfigurationError("--tasks requires at least one task name");
        }
    }
    if (cli_params.count("--sequential")) {
        run.sequential = true;
    }
    if (cli_params.count("--status")) {
        run.status_only = true;
    }

    // --force wins over --resume
    if (cli_params.count("--force")) {
        run.cache_mode = CacheMode::Force;
    } else if (cli_params.count("--resume")) {
        run.cache_mode = CacheMode::Resume;
    }

    if (!positional_args.empty()) {
        run.input_path = positional_args.front();
    }
}

void ParameterContext::merge_environment_vars() {
    auto& global_config = config_data.global;

    if (const char* output_dir = std::getenv("AGENTPIPE_OUTPUT_DIR")) {
        if (*output_dir) {
            global_config.output_dir = output_dir;
        }
    }
    if (const char* timeout = std::getenv("AGENTPIPE_TIMEOUT")) {
        if (*timeout) {
            global_config.timeout = parse_duration(timeout, "AGENTPIPE_TIMEOUT");
        }
    }
}

void ParameterContext::validate() const {
    const auto& personas = valid_personas();
    if (std::find(personas.begin(), personas.end(), config_data.profile.persona) == personas.end()) {
        throw ConfigurationError("Invalid persona '" + config_data.profile.persona
            + "' (valid: " + StringUtils::join(personas, ", ") + ")");
    }

    for (const auto& [name, task] : config_data.tasks) {
        if (task.output.empty()) {
            throw ConfigurationError("Task '" + name + "' has no output path");
        }
        for (const auto& dep : task.depends_on) {
            if (config_data.tasks.find(dep) == config_data.tasks.end()) {
                throw ConfigurationError("Task '" + name + "' depends on unknown task '" + dep + "'");
            }
        }
    }

    if (!config_data.run.status_only && config_data.run.input_path.empty()) {
        throw ConfigurationError("Missing required argument: <input>");
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();
    validate();
    return true;
}

const ConfigData& ParameterContext::get_config_data() const {
    return config_data;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return config_data.global;
}

const ProjectProfile& ParameterContext::get_profile() const {
    return config_data.profile;
}

const TaskRegistry& ParameterContext::get_tasks() const {
    return config_data.tasks;
}
