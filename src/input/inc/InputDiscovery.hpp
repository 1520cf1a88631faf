#pragma once

#include <string>
#include <vector>

struct InputSet {
    bool is_directory = false;
    std::string path;                 // Absolute input path (file or directory)
    std::vector<std::string> files;   // Absolute paths, sorted
    std::string primary_file;

    // Directory the input hash is computed relative to
    std::string root() const;
    std::vector<std::string> relative_paths() const;
    std::string summary() const;
};

class InputDiscovery {
public:
    static const std::vector<std::string>& supported_extensions();

    // Throws ConfigurationError when the path is missing or a directory holds no usable files
    static InputSet discover(const std::string& path);

    static std::string find_primary_file(const std::vector<std::string>& files);

private:
    static std::vector<std::string> scan_directory(const std::string& dir);
    static bool is_supported(const std::string& path);
};
