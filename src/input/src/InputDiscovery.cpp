#include "InputDiscovery.hpp"
#include "StringUtils.hpp"
#include "TaskError.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

const std::vector<std::string>& InputDiscovery::supported_extensions() {
    static const std::vector<std::string> extensions = {
        ".md", ".yaml", ".yml", ".json", ".txt"
    };
    return extensions;
}

bool InputDiscovery::is_supported(const std::string& path) {
    const std::string ext = StringUtils::to_lower(fs::path(path).extension().string());
    const auto& supported = supported_extensions();
    return std::find(supported.begin(), supported.end(), ext) != supported.end();
}

InputSet InputDiscovery::discover(const std::string& path) {
    std::error_code ec;
    fs::path abs_path = fs::absolute(path, ec);
    if (ec || !fs::exists(abs_path, ec)) {
        throw ConfigurationError("Input path not found: " + path);
    }
    abs_path = abs_path.lexically_normal();

    InputSet input;
    input.path = abs_path.string();

    if (!fs::is_directory(abs_path, ec)) {
        input.files = {input.path};
        input.primary_file = input.path;
        return input;
    }

    input.is_directory = true;
    input.files = scan_directory(input.path);
    if (input.files.empty()) {
        throw ConfigurationError("No supported input files found in " + input.path +
                                 " (supported: " + StringUtils::join(supported_extensions(), " ") + ")");
    }
    input.primary_file = find_primary_file(input.files);
    return input;
}

std::vector<std::string> InputDiscovery::scan_directory(const std::string& dir) {
    std::vector<std::string> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        const std::string name = entry.path().filename().string();
        const bool hidden = !name.empty() && name[0] == '.';

        if (entry.is_directory(ec)) {
            if (hidden) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (!hidden && entry.is_regular_file(ec) && is_supported(entry.path().string())) {
            files.push_back(entry.path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

// A name containing "prd" wins, then the first markdown file, then the first file
std::string InputDiscovery::find_primary_file(const std::vector<std::string>& files) {
    if (files.empty()) {
        return "";
    }

    for (const auto& file : files) {
        if (StringUtils::contains_ignore_case(fs::path(file).filename().string(), "prd")) {
            return file;
        }
    }

    for (const auto& file : files) {
        if (StringUtils::to_lower(fs::path(file).extension().string()) == ".md") {
            return file;
        }
    }

    return files.front();
}

std::string InputSet::root() const {
    if (is_directory) {
        return path;
    }
    return fs::path(path).parent_path().string();
}

std::vector<std::string> InputSet::relative_paths() const {
    std::vector<std::string> result;
    const std::string base = root();
    for (const auto& file : files) {
        std::error_code ec;
        auto rel = fs::relative(file, base, ec);
        result.push_back(ec ? file : rel.generic_string());
    }
    return result;
}

std::string InputSet::summary() const {
    if (!is_directory) {
        return "Input: " + path;
    }
    return "Input: " + path + " (" + std::to_string(files.size()) + " files, primary: " +
           fs::path(primary_file).filename().string() + ")";
}
