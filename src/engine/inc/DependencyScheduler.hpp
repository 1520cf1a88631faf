#pragma once

#include <string>
#include <vector>

#include "TaskDefinition.hpp"
#include "TaskError.hpp"

using DependencyLevels = std::vector<std::vector<std::string>>;

// Ordering queries over the static task registry. Queries that take a subset only honor
// edges whose both ends are inside the subset.
class DependencyScheduler {
public:
    // Throws ConfigurationError on unknown dependency names or a cycle anywhere in the registry.
    explicit DependencyScheduler(const TaskRegistry& registry);

    // Kahn's algorithm restricted to `names`. Level 0 has no in-subset dependencies.
    // Throws ConfigurationError if the subset contains a cycle.
    DependencyLevels dependency_levels(const std::vector<std::string>& names) const;

    // Levels flattened: every dependency precedes its dependents.
    std::vector<std::string> topological_sort(const std::vector<std::string>& names) const;

    // Every ancestor of `name` over the full registry, dependencies before dependents.
    std::vector<std::string> transitive_dependencies(const std::string& name) const;

    // Requested names plus their transitive dependencies, in topological order.
    std::vector<std::string> expand_with_dependencies(const std::vector<std::string>& names) const;

    // Throws ConfigurationError naming the first unknown task.
    void validate_names(const std::vector<std::string>& names) const;

    const std::vector<std::string>& dependencies_of(const std::string& name) const;
    std::vector<std::string> task_names() const;

private:
    const TaskRegistry& registry_;
};
