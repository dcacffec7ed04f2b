#pragma once

#include "signal.hpp"
#include <string>
#include <vector>

// Pulls path, symbol and error-token signals out of task text and pasted
// error output. Stack frames carry {path, line, character, depth}.
class SignalExtractor {
public:
    static std::vector<Signal> extract(const std::string& text);

    // Working-set files become path signals sourced from the editor state.
    static std::vector<Signal> from_working_set(const std::vector<std::string>& paths);

    static bool looks_like_path(const std::string& token);

private:
    static void extract_stack_frames(const std::string& text, std::vector<Signal>& out);
    static void extract_tokens(const std::string& text, std::vector<Signal>& out);
    static void push_unique(std::vector<Signal>& out, Signal signal);
};
