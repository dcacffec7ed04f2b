#include "signal.hpp"

std::optional<int> Signal::stack_depth() const {
    if (source != SignalSource::StackTrace) return std::nullopt;
    if (!metadata.is_object() || !metadata.contains("depth")) return std::nullopt;
    const auto& depth = metadata["depth"];
    if (!depth.is_number_integer()) return std::nullopt;
    int d = depth.get<int>();
    return d < 0 ? 0 : d;
}

std::optional<std::string> Signal::location_path() const {
    if (!metadata.is_object() || !metadata.contains("path")) return std::nullopt;
    const auto& p = metadata["path"];
    if (!p.is_string() || p.get<std::string>().empty()) return std::nullopt;
    return p.get<std::string>();
}

std::optional<int> Signal::location_line() const {
    if (!metadata.is_object() || !metadata.contains("line")) return std::nullopt;
    const auto& l = metadata["line"];
    if (!l.is_number_integer()) return std::nullopt;
    return l.get<int>();
}

int Signal::location_character() const {
    if (!metadata.is_object() || !metadata.contains("character")) return 0;
    const auto& c = metadata["character"];
    return c.is_number_integer() ? c.get<int>() : 0;
}

bool Signal::same_fact(const Signal& other) const {
    return type == other.type && value == other.value;
}

bool Signal::operator==(const Signal& other) const {
    return type == other.type && value == other.value && source == other.source &&
           confidence == other.confidence && metadata == other.metadata;
}

std::string to_string(SignalType type) {
    switch (type) {
        case SignalType::Path: return "path";
        case SignalType::Symbol: return "symbol";
        case SignalType::ErrorToken: return "error_token";
    }
    return "symbol";
}

std::string to_string(SignalSource source) {
    switch (source) {
        case SignalSource::UserMessage: return "user_message";
        case SignalSource::StackTrace: return "stack_trace";
        case SignalSource::ErrorOutput: return "error_output";
        case SignalSource::WorkingSet: return "working_set";
    }
    return "user_message";
}

nlohmann::json signal_to_json(const Signal& signal) {
    nlohmann::json j;
    j["type"] = to_string(signal.type);
    j["value"] = signal.value;
    j["source"] = to_string(signal.source);
    j["confidence"] = signal.confidence;
    if (!signal.metadata.is_null()) {
        j["metadata"] = signal.metadata;
    }
    return j;
}
