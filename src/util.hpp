#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    std::string generate_id(const std::string& prefix);

    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::string to_lower(const std::string& str);
    bool ends_with(const std::string& str, const std::string& suffix);
    bool contains(const std::string& haystack, const std::string& needle);
    bool contains_ci(const std::string& haystack, const std::string& needle);

    // Backslashes become forward slashes, then lowercased.
    std::string normalize_path(const std::string& path);

    // True when `word` occurs in `text` with no identifier character on either side.
    bool contains_word(const std::string& text, const std::string& word);

    // Escapes ECMAScript regex metacharacters.
    std::string escape_regex(const std::string& str);

    size_t count_lines(const std::string& content);
}
