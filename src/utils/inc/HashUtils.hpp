#pragma once

#include <string>
#include <vector>

namespace HashUtils {

// Hex-encoded SHA-256 of a byte string.
std::string sha256_hex(const std::string& data);

// Hex-encoded SHA-256 of a file's content. Throws std::runtime_error if unreadable.
std::string hash_file(const std::string& path);

// Combined hash of a file set. Each entry contributes its relative path and its content,
// separated by NUL bytes; entries are sorted by relative path first.
std::string hash_files(const std::vector<std::string>& paths, const std::string& base_dir = "");

}
