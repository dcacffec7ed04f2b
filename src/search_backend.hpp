#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct SearchRequest {
    std::string pattern;  // ECMAScript-compatible regex
    std::vector<std::string> paths;
    std::vector<std::string> globs;
    std::vector<std::string> excludes;
    int context_lines = 0;
    size_t max_results = 0;  // 0 = unlimited
    bool case_sensitive = true;
};

struct SearchMatch {
    std::string file;
    int line = 0;  // 1-based
    std::string content;
    std::vector<std::string> before;  // context lines, nearest last
    std::vector<std::string> after;   // context lines, nearest first
};

// Full-text search backend. A failed search returns std::nullopt; a search
// with no hits returns an empty vector.
class SearchBackend {
public:
    virtual ~SearchBackend() = default;

    virtual std::string name() const = 0;
    virtual bool is_available() = 0;
    virtual std::optional<std::vector<SearchMatch>> search(const SearchRequest& request) = 0;
};
