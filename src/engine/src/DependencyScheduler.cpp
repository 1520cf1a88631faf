#include "DependencyScheduler.hpp"
#include "StringUtils.hpp"

#include <functional>
#include <unordered_map>
#include <unordered_set>

namespace {

std::vector<std::string> unique_in_order(const std::vector<std::string>& names) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto& name : names) {
        if (seen.insert(name).second) {
            result.push_back(name);
        }
    }
    return result;
}

}

DependencyScheduler::DependencyScheduler(const TaskRegistry& registry) : registry_(registry) {
    for (const auto& [name, task] : registry_) {
        for (const auto& dep : task.depends_on) {
            if (registry_.find(dep) == registry_.end()) {
                throw ConfigurationError("Task '" + name + "' depends on unknown task '" + dep + "'");
            }
        }
    }

    // Whole-registry cycle check
    dependency_levels(task_names());
}

DependencyLevels DependencyScheduler::dependency_levels(const std::vector<std::string>& names) const {
    const std::vector<std::string> tasks = unique_in_order(names);
    const std::unordered_set<std::string> subset(tasks.begin(), tasks.end());

    std::unordered_map<std::string, int> in_degree;
    std::unordered_map<std::string, std::vector<std::string>> dependents;
    for (const auto& task : tasks) {
        in_degree[task] = 0;
    }
    for (const auto& task : tasks) {
        for (const auto& dep : dependencies_of(task)) {
            if (subset.count(dep)) {
                in_degree[task]++;
                dependents[dep].push_back(task);
            }
        }
    }

    DependencyLevels levels;
    std::unordered_set<std::string> assigned;
    while (assigned.size() < tasks.size()) {
        std::vector<std::string> level;
        for (const auto& task : tasks) {
            if (!assigned.count(task) && in_degree[task] == 0) {
                level.push_back(task);
            }
        }

        if (level.empty()) {
            break;
        }

        for (const auto& task : level) {
            assigned.insert(task);
        }
        for (const auto& task : level) {
            for (const auto& dependent : dependents[task]) {
                in_degree[dependent]--;
            }
        }
        levels.push_back(std::move(level));
    }

    if (assigned.size() < tasks.size()) {
        std::vector<std::string> cyclic;
        for (const auto& task : tasks) {
            if (!assigned.count(task)) {
                cyclic.push_back(task);
            }
        }
        throw ConfigurationError("Dependency cycle detected among tasks: " + StringUtils::join(cyclic, ", "));
    }

    return levels;
}

std::vector<std::string> DependencyScheduler::topological_sort(const std::vector<std::string>& names) const {
    std::vector<std::string> result;
    for (auto& level : dependency_levels(names)) {
        result.insert(result.end(), level.begin(), level.end());
    }
    return result;
}

std::vector<std::string> DependencyScheduler::transitive_dependencies(const std::string& name) const {
    std::unordered_set<std::string> visited;
    std::vector<std::string> result;

    std::function<void(const std::string&)> visit = [&](const std::string& current) {
        if (!visited.insert(current).second) {
            return;
        }
        for (const auto& dep : dependencies_of(current)) {
            visit(dep);
        }
        // Post-order: dependencies land before their dependents
        if (current != name) {
            result.push_back(current);
        }
    };

    visit(name);
    return result;
}

std::vector<std::string> DependencyScheduler::expand_with_dependencies(const std::vector<std::string>& names) const {
    std::vector<std::string> expanded;
    for (const auto& name : names) {
        for (auto& dep : transitive_dependencies(name)) {
            expanded.push_back(std::move(dep));
        }
        expanded.push_back(name);
    }
    return topological_sort(unique_in_order(expanded));
}

void DependencyScheduler::validate_names(const std::vector<std::string>& names) const {
    for (const auto& name : names) {
        if (registry_.find(name) == registry_.end()) {
            throw ConfigurationError("Unknown task: " + name + " (available: " +
                                     StringUtils::join(task_names(), ", ") + ")");
        }
    }
}

const std::vector<std::string>& DependencyScheduler::dependencies_of(const std::string& name) const {
    static const std::vector<std::string> none;
    auto it = registry_.find(name);
    return it == registry_.end() ? none : it->second.depends_on;
}

std::vector<std::string> DependencyScheduler::task_names() const {
    std::vector<std::string> names;
    names.reserve(registry_.size());
    for (const auto& kv : registry_) {
        names.push_back(kv.first);
    }
    return names;
}
