#pragma once

#include <string>
#include <vector>
#include "ConfigData.hpp"

// What a payload renderer may draw on for one run
struct RunContext {
    std::string input_root;                // Directory the input hash is relative to
    std::string primary_file;
    std::vector<std::string> input_files;  // Absolute paths, sorted
    std::string output_dir;
    ProjectProfile profile;
};
