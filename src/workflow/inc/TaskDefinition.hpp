#pragma once

#include <map>
#include <string>
#include <vector>

struct TaskDefinition {
    std::string name;                     // Task identifier
    std::string output;                   // Output path, relative to the output directory
    std::vector<std::string> depends_on;  // Prerequisite tasks
    std::string prompt;                   // Inline payload template (takes precedence)
    std::string prompt_file;              // Payload template file

    TaskDefinition() = default;
    TaskDefinition(const std::string& name,
                   const std::string& output,
                   const std::vector<std::string>& depends_on)
        : name(name), output(output), depends_on(depends_on) {}
};

// Ordered by name so that "all tasks" has a stable order
using TaskRegistry = std::map<std::string, TaskDefinition>;
