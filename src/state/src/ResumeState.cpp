#include "ResumeState.hpp"

RegenerationDecision evaluate_regeneration(const ResumeState& state,
                                           const std::string& task_name,
                                           const OutputSnapshot& current,
                                           const std::vector<std::string>& dependency_names) {
    auto it = state.task_outputs.find(task_name);
    if (it == state.task_outputs.end()) {
        return {true, "no previous output recorded"};
    }
    const TaskOutputRecord& record = it->second;

    if (!current.exists) {
        return {true, "output file does not exist"};
    }

    if (!current.hash_error.empty()) {
        return {true, "failed to hash current output: " + current.hash_error};
    }

    if (current.hash != record.output_hash) {
        return {true, "output file was modified externally"};
    }

    if (state.input_hash != record.input_hash_at_generation) {
        return {true, "input files changed"};
    }

    if (state.config_hash != record.config_hash_at_generation) {
        return {true, "configuration changed"};
    }

    for (const auto& dep : dependency_names) {
        auto dep_it = state.task_outputs.find(dep);
        if (dep_it == state.task_outputs.end()) {
            return {true, "dependency " + dep + " has no recorded output"};
        }

        auto snapshot = record.dependency_hashes.find(dep);
        if (snapshot == record.dependency_hashes.end()) {
            return {true, "dependency " + dep + " was not recorded at generation time"};
        }

        if (dep_it->second.output_hash != snapshot->second) {
            return {true, "dependency " + dep + " output changed"};
        }
    }

    return {false, "up-to-date"};
}

void to_json(nlohmann::json& j, const TaskOutputRecord& record) {
    j = nlohmann::json{
        {"output_path", record.output_path},
        {"output_hash", record.output_hash},
        {"input_hash_at_generation", record.input_hash_at_generation},
        {"config_hash_at_generation", record.config_hash_at_generation},
        {"dependency_hashes", record.dependency_hashes}
    };
}

void from_json(const nlohmann::json& j, TaskOutputRecord& record) {
    record.output_path = j.value("output_path", "");
    record.output_hash = j.value("output_hash", "");
    record.input_hash_at_generation = j.value("input_hash_at_generation", "");
    record.config_hash_at_generation = j.value("config_hash_at_generation", "");
    record.dependency_hashes.clear();
    if (j.contains("dependency_hashes") && j["dependency_hashes"].is_object()) {
        record.dependency_hashes = j["dependency_hashes"].get<std::map<std::string, std::string>>();
    }
}

void to_json(nlohmann::json& j, const ResumeState& state) {
    j = nlohmann::json{
        {"input_hash", state.input_hash},
        {"config_hash", state.config_hash},
        {"task_outputs", state.task_outputs}
    };
}

void from_json(const nlohmann::json& j, ResumeState& state) {
    state.input_hash = j.value("input_hash", "");
    state.config_hash = j.value("config_hash", "");
    state.task_outputs.clear();
    if (j.contains("task_outputs") && j["task_outputs"].is_object()) {
        state.task_outputs = j["task_outputs"].get<std::map<std::string, TaskOutputRecord>>();
    }
}
