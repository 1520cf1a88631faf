#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "ConfigData.hpp"
#include "ResumeState.hpp"

// Loads, consults, updates and persists the resume state of one output directory.
// Safe to call from the task threads of a parallel level.
class ResumeStateManager {
public:
    static constexpr const char* STATE_FILE = ".agentpipe/.resume-state.json";

    explicit ResumeStateManager(const std::string& output_dir);

    // Unreadable or corrupt state is logged and replaced by an empty state.
    // Returns false in that case, true when the file was loaded or is absent.
    bool load();

    // Writes a temporary file and renames it over the state file.
    // Returns false (and logs) when the file cannot be written.
    bool save() const;

    void update_input_hash(const std::vector<std::string>& files, const std::string& base_dir = "");
    void update_config_hash(const ProjectProfile& profile);

    // Hashes the produced output and snapshots the current hashes of its dependencies.
    void record_output(const std::string& task_name,
                       const std::string& output_path,
                       const std::vector<std::string>& dependency_names);

    RegenerationDecision should_regenerate(const std::string& task_name,
                                           const std::string& output_path,
                                           const std::vector<std::string>& dependency_names) const;

    // Drops all recorded state and deletes the persisted file.
    void clear();

    ResumeState snapshot() const;
    const std::string& state_path() const { return state_path_; }

    static std::string hash_profile(const ProjectProfile& profile);

private:
    std::string state_path_;
    ResumeState state_;
    mutable std::mutex mutex_;
    mutable std::mutex save_mutex_;
};
