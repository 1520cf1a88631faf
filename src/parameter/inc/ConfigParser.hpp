#pragma once

#include "ConfigData.hpp"
#include "TaskError.hpp"
#include "StringUtils.hpp"

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        if (!node.IsMap()) {
            throw ConfigurationError("Expected a mapping for " + context);
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw ConfigurationError("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    // Scalar values keep their text, sequences are joined with ", "
    inline std::map<std::string, std::string> as_string_map(const YAML::Node& node, const std::string& context) {
        if (!node.IsMap()) {
            throw ConfigurationError("Expected a mapping for " + context);
        }
        std::map<std::string, std::string> result;
        for (auto it = node.begin(); it != node.end(); ++it) {
            const std::string key = it->first.as<std::string>();
            const YAML::Node& value = it->second;
            if (value.IsSequence()) {
                result[key] = StringUtils::join(value.as<std::vector<std::string>>(), ", ");
            } else if (value.IsScalar()) {
                result[key] = value.as<std::string>();
            } else if (value.IsNull()) {
                result[key] = "";
            } else {
                throw ConfigurationError("Unsupported value for " + context + "::" + key);
            }
        }
        return result;
    }

    template<>
    struct convert<TaskDefinition> {
        static bool decode(const Node& node, TaskDefinition& rhs) {
            static const std::set<std::string> valid_keys = {
                "output", "depends_on", "prompt", "prompt_file"
            };
            check_unknown_keys(node, valid_keys, "tasks::task");

            if (!node["output"]) {
                throw ConfigurationError("Missing required field 'output' for task");
            }
            rhs.output = node["output"].as<std::string>();

            if (node["depends_on"]) {
                rhs.depends_on = node["depends_on"].as<std::vector<std::string>>();
            }
            if (node["prompt"]) {
                rhs.prompt = node["prompt"].as<std::string>();
            }
            if (node["prompt_file"]) {
                rhs.prompt_file = node["prompt_file"].as<std::string>();
            }
            return true;
        }
    };

    template<>
    struct convert<WorkerConfig> {
        static bool decode(const Node& node, WorkerConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "command", "base_port", "health_timeout", "poll_interval_ms", "max_poll_failures"
            };
            check_unknown_keys(node, valid_keys, "worker");

            if (node["command"]) {
                rhs.command = node["command"].as<std::vector<std::string>>();
                if (rhs.command.empty()) {
                    throw ConfigurationError("worker::command must not be empty");
                }
            }
            if (node["base_port"]) {
                rhs.base_port = node["base_port"].as<int>();
                if (rhs.base_port <= 0 || rhs.base_port > 65535) {
                    throw ConfigurationError("worker::base_port out of range: " + std::to_string(rhs.base_port));
                }
            }
            if (node["health_timeout"]) {
                rhs.health_timeout = std::chrono::seconds(node["health_timeout"].as<int>());
            }
            if (node["poll_interval_ms"]) {
                rhs.poll_interval = std::chrono::milliseconds(node["poll_interval_ms"].as<int>());
            }
            if (node["max_poll_failures"]) {
                rhs.max_poll_failures = node["max_poll_failures"].as<int>();
                if (rhs.max_poll_failures <= 0) {
                    throw ConfigurationError("worker::max_poll_failures must be positive");
                }
            }
            return true;
        }
    };

}
