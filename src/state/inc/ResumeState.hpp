#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Output of one task as it was when last generated
struct TaskOutputRecord {
    std::string output_path;
    std::string output_hash;
    std::string input_hash_at_generation;
    std::string config_hash_at_generation;
    std::map<std::string, std::string> dependency_hashes;  // dependency -> its output hash then
};

struct ResumeState {
    std::string input_hash;
    std::string config_hash;
    std::map<std::string, TaskOutputRecord> task_outputs;
};

// What the output file looks like right now
struct OutputSnapshot {
    bool exists = false;
    std::string hash;
    std::string hash_error;  // Set when the file exists but could not be hashed
};

struct RegenerationDecision {
    bool regenerate = true;
    std::string reason;
};

// Cache invalidation rules. Pure: every filesystem fact arrives through `current`.
RegenerationDecision evaluate_regeneration(const ResumeState& state,
                                           const std::string& task_name,
                                           const OutputSnapshot& current,
                                           const std::vector<std::string>& dependency_names);

void to_json(nlohmann::json& j, const TaskOutputRecord& record);
void from_json(const nlohmann::json& j, TaskOutputRecord& record);
void to_json(nlohmann::json& j, const ResumeState& state);
void from_json(const nlohmann::json& j, ResumeState& state);
