#pragma once

#include <string>
#include <vector>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);

    // Split on a delimiter, trimming items and dropping empty ones.
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& items, const std::string& separator);

    static void replace_all(std::string& str, const std::string& from, const std::string& to);
    static bool contains_ignore_case(const std::string& haystack, const std::string& needle);
};
