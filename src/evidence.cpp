#include "evidence.hpp"
#include "util.hpp"
#include <cmath>
#include <stdexcept>

namespace {

constexpr double kTokensPerChar = 0.25;

// Iterative glob match where '*' spans any characters, '/' included.
bool glob_match(const std::string& text, const std::string& pattern) {
    size_t t = 0;
    size_t p = 0;
    size_t star = std::string::npos;
    size_t mark = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            p++;
            t++;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') p++;
    return p == pattern.size();
}

} // namespace

std::string to_string(ProviderType type) {
    switch (type) {
        case ProviderType::Diff: return "diff";
        case ProviderType::Lsp: return "lsp";
        case ProviderType::Search: return "search";
    }
    return "diff";
}

std::string to_string(ChangeType type) {
    switch (type) {
        case ChangeType::Added: return "added";
        case ChangeType::Modified: return "modified";
        case ChangeType::Deleted: return "deleted";
    }
    return "modified";
}

std::string to_string(SymbolKind kind) {
    return kind == SymbolKind::Definition ? "definition" : "reference";
}

ProviderType provider_type_from_string(const std::string& name) {
    std::string n = util::to_lower(util::trim(name));
    if (n == "diff") return ProviderType::Diff;
    if (n == "lsp") return ProviderType::Lsp;
    if (n == "search") return ProviderType::Search;
    throw std::invalid_argument("Unknown provider type: " + name);
}

size_t estimate_tokens(const std::string& content) {
    return static_cast<size_t>(std::ceil(static_cast<double>(content.size()) * kTokensPerChar));
}

std::vector<Evidence> apply_token_budget(std::vector<Evidence> evidence, size_t max_tokens) {
    std::vector<Evidence> result;
    if (evidence.empty() || max_tokens == 0) return result;

    size_t running = 0;
    for (auto& item : evidence) {
        if (running + item.tokens > max_tokens) {
            if (result.empty()) {
                result.push_back(std::move(item));
            }
            break;
        }
        running += item.tokens;
        result.push_back(std::move(item));
    }
    return result;
}

size_t total_tokens(const std::vector<Evidence>& evidence) {
    size_t total = 0;
    for (const auto& e : evidence) total += e.tokens;
    return total;
}

bool matches_pattern(const std::string& path, const std::string& pattern) {
    std::string p = util::normalize_path(path);
    std::string pat = util::normalize_path(pattern);
    if (pat.empty()) return false;

    if (pat.find('*') == std::string::npos) {
        return util::contains(p, pat);
    }

    if (glob_match(p, pat)) return true;
    for (size_t slash = p.find('/'); slash != std::string::npos; slash = p.find('/', slash + 1)) {
        if (glob_match(p.substr(slash + 1), pat)) return true;
    }
    return false;
}

bool matches_any_pattern(const std::string& path, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (matches_pattern(path, pattern)) return true;
    }
    return false;
}

bool passes_filters(const std::string& path, const ProviderQueryOptions& options) {
    if (!options.include_patterns.empty() && !matches_any_pattern(path, options.include_patterns)) {
        return false;
    }
    if (!options.exclude_patterns.empty() && matches_any_pattern(path, options.exclude_patterns)) {
        return false;
    }
    return true;
}

std::string range_key(const Evidence& evidence) {
    return evidence.path + ":" + std::to_string(evidence.range.first) + "-" +
           std::to_string(evidence.range.second);
}

nlohmann::json evidence_to_json(const Evidence& evidence) {
    nlohmann::json j;
    j["id"] = evidence.id;
    j["provider"] = to_string(evidence.provider);
    j["path"] = evidence.path;
    j["range"] = {evidence.range.first, evidence.range.second};
    j["content"] = evidence.content;
    j["tokens"] = evidence.tokens;
    j["base_score"] = evidence.base_score;

    nlohmann::json signals = nlohmann::json::array();
    for (const auto& s : evidence.matched_signals) {
        signals.push_back(signal_to_json(s));
    }
    j["matched_signals"] = signals;

    nlohmann::json meta = nlohmann::json::object();
    if (evidence.metadata.change_type) meta["change_type"] = to_string(*evidence.metadata.change_type);
    if (evidence.metadata.symbol_kind) meta["symbol_kind"] = to_string(*evidence.metadata.symbol_kind);
    if (evidence.metadata.match_count) meta["match_count"] = *evidence.metadata.match_count;
    j["metadata"] = meta;
    return j;
}
