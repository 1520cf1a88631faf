#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>
#include "TaskDefinition.hpp"

enum class CacheMode {
    Normal,  // Run every task, record outputs
    Resume,  // Skip tasks whose recorded output is still valid
    Force    // Discard recorded state, run every task
};

const char* to_string(CacheMode mode);

struct WorkerConfig {
    std::vector<std::string> command = {"agentapi", "server", "--port", "{port}", "--", "claude"};
    int base_port = 3284;
    std::chrono::seconds health_timeout{120};
    std::chrono::milliseconds health_poll_interval{500};
    std::chrono::milliseconds poll_interval{1000};
    int max_poll_failures = 30;
};

// Configuration that feeds the config hash
struct ProjectProfile {
    std::string persona = "balanced";
    std::map<std::string, std::string> stack;
    std::map<std::string, std::string> preferences;
};

struct GlobalConfig {
    bool verbose = false;
    std::string log_dir = "log/";
    std::string output_dir = "./outputs";
    std::chrono::seconds timeout{0};  // 0 = poll until completion
};

struct RunOptions {
    std::string input_path;
    std::vector<std::string> tasks;  // Empty = every registered task
    bool sequential = false;
    CacheMode cache_mode = CacheMode::Normal;
    bool status_only = false;
};

// Top-level config
struct ConfigData {
    GlobalConfig global;
    ProjectProfile profile;
    WorkerConfig worker;
    RunOptions run;
    TaskRegistry tasks;
};
