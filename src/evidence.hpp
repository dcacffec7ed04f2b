#pragma once

#include "cancellation.hpp"
#include "signal.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

enum class ProviderType {
    Diff,
    Lsp,
    Search
};

enum class ChangeType {
    Added,
    Modified,
    Deleted
};

enum class SymbolKind {
    Definition,
    Reference
};

struct EvidenceMetadata {
    std::optional<ChangeType> change_type;   // diff
    std::optional<SymbolKind> symbol_kind;   // lsp
    std::optional<int> match_count;          // search
};

struct Evidence {
    std::string id;
    ProviderType provider = ProviderType::Diff;
    std::string path;
    std::pair<int, int> range{1, 1};  // 1-based, inclusive
    std::string content;
    size_t tokens = 0;
    double base_score = 0.0;
    std::vector<Signal> matched_signals;
    EvidenceMetadata metadata;
};

struct ProviderQueryOptions {
    std::optional<size_t> max_results;
    std::optional<size_t> max_tokens;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    std::optional<int> context_lines;
    CancellationToken cancel;
};

// One evidence source (diff, lsp, search). Implementations never throw from
// is_available() and degrade to an empty result on backend failure.
class EvidenceProvider {
public:
    virtual ~EvidenceProvider() = default;

    virtual ProviderType type() const = 0;
    virtual std::string name() const = 0;
    virtual double base_weight() const = 0;

    virtual bool is_available() = 0;
    virtual std::vector<Evidence> query(const std::vector<Signal>& signals,
                                        const ProviderQueryOptions& options) = 0;
};

std::string to_string(ProviderType type);
std::string to_string(ChangeType type);
std::string to_string(SymbolKind kind);
ProviderType provider_type_from_string(const std::string& name);

// ceil(chars * 0.25)
size_t estimate_tokens(const std::string& content);

// Walks items in order, appending while the running total fits. The first
// item is kept even when it alone exceeds the budget, so a non-empty input
// with a non-zero budget never yields an empty list.
std::vector<Evidence> apply_token_budget(std::vector<Evidence> evidence, size_t max_tokens);

size_t total_tokens(const std::vector<Evidence>& evidence);

// Case-insensitive. `*` matches any run of characters and the pattern must
// cover the whole path or a suffix starting at a path segment; patterns
// without `*` match as plain substrings.
bool matches_pattern(const std::string& path, const std::string& pattern);
bool matches_any_pattern(const std::string& path, const std::vector<std::string>& patterns);

// Include list empty means everything is included.
bool passes_filters(const std::string& path, const ProviderQueryOptions& options);

std::string range_key(const Evidence& evidence);

nlohmann::json evidence_to_json(const Evidence& evidence);
