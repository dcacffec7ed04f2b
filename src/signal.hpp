#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class SignalType {
    Path,
    Symbol,
    ErrorToken
};

enum class SignalSource {
    UserMessage,
    StackTrace,
    ErrorOutput,
    WorkingSet
};

// A typed fact pulled from the task text or the environment. Immutable once
// built; providers and the reranker only read it.
struct Signal {
    SignalType type = SignalType::Symbol;
    std::string value;
    SignalSource source = SignalSource::UserMessage;
    double confidence = 1.0;
    nlohmann::json metadata;  // null when absent

    // Stack-frame depth carried in metadata ("depth"), when the signal came from a trace.
    std::optional<int> stack_depth() const;

    // Source position carried in metadata ("path", "line", "character").
    std::optional<std::string> location_path() const;
    std::optional<int> location_line() const;
    int location_character() const;

    bool same_fact(const Signal& other) const;
    bool operator==(const Signal& other) const;
    bool operator!=(const Signal& other) const { return !(*this == other); }
};

std::string to_string(SignalType type);
std::string to_string(SignalSource source);

nlohmann::json signal_to_json(const Signal& signal);
