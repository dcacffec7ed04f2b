#pragma once

#include "search_backend.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class RipgrepBackend : public SearchBackend {
public:
    explicit RipgrepBackend(std::string rg_path = "rg",
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));

    std::string name() const override { return "ripgrep"; }
    bool is_available() override;
    std::optional<std::vector<SearchMatch>> search(const SearchRequest& request) override;

    // Parses `rg --json` output; context events are attached to the matches
    // they surround.
    static std::vector<SearchMatch> parse_json_output(const std::string& output, int context_lines);

private:
    std::string rg_path_;
    std::chrono::milliseconds timeout_;
    std::mutex mutex_;
    std::optional<bool> available_;
};
