#pragma once

#include "ConfigParser.hpp"
#include "ConfigData.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when only help or version was requested
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    // Registry and option consistency, throws ConfigurationError
    void validate() const;

    const ConfigData& get_config_data() const;
    const GlobalConfig& get_global_config() const;
    const ProjectProfile& get_profile() const;
    const TaskRegistry& get_tasks() const;

    static const std::vector<std::string>& valid_personas();

private:
    ConfigData config_data;  // Top-level config data

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;
    std::vector<std::string> positional_args;

    void load_default_config();
    std::string find_config_file() const;
    void parse_global(const YAML::Node& config);
    void parse_profile(const YAML::Node& config);
    void parse_tasks(const YAML::Node& tasks_node);

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--output")
        char short_opt;          // Short option (e.g. 'o')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
