#include "search_provider.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace {

constexpr size_t kMinSymbolLength = 2;
constexpr size_t kMinErrorTokenLength = 3;

} // namespace

SearchProvider::SearchProvider(SearchProviderConfig config, std::shared_ptr<SearchBackend> backend)
    : config_(std::move(config)), backend_(std::move(backend)) {}

bool SearchProvider::is_available() {
    if (!backend_) return false;
    try {
        return backend_->is_available();
    } catch (const std::exception& e) {
        spdlog::warn("Search availability check failed: {}", e.what());
        return false;
    }
}

std::vector<Signal> SearchProvider::searchable_signals(const std::vector<Signal>& signals) {
    std::vector<Signal> out;
    for (const auto& s : signals) {
        if (s.type == SignalType::Symbol && s.value.size() >= kMinSymbolLength) {
            out.push_back(s);
        } else if (s.type == SignalType::ErrorToken && s.value.size() >= kMinErrorTokenLength) {
            out.push_back(s);
        }
    }
    return out;
}

std::vector<std::string> SearchProvider::merge_patterns(const std::vector<std::string>& base,
                                                        const std::vector<std::string>& extra) {
    std::vector<std::string> merged = base;
    for (const auto& p : extra) {
        if (std::find(merged.begin(), merged.end(), p) == merged.end()) {
            merged.push_back(p);
        }
    }
    return merged;
}

SearchRequest SearchProvider::build_request(const Signal& signal,
                                            const std::vector<std::string>& includes,
                                            const std::vector<std::string>& excludes,
                                            int context_lines) const {
    bool is_symbol = signal.type == SignalType::Symbol;

    SearchRequest req;
    req.pattern = is_symbol ? "\\b" + util::escape_regex(signal.value) + "\\b"
                            : util::escape_regex(signal.value);
    req.paths = {config_.workspace_root};
    req.globs = includes;
    req.excludes = excludes;
    req.context_lines = context_lines;
    req.max_results = config_.max_results_per_signal;
    req.case_sensitive = is_symbol;
    return req;
}

std::vector<SearchProvider::MatchRange> SearchProvider::merge_ranges(std::vector<const SearchMatch*> matches,
                                                                     int context_lines) {
    std::vector<MatchRange> ranges;
    if (matches.empty()) return ranges;

    std::sort(matches.begin(), matches.end(),
              [](const SearchMatch* a, const SearchMatch* b) { return a->line < b->line; });

    MatchRange current;
    current.start_line = std::max(1, matches[0]->line - context_lines);
    current.end_line = matches[0]->line + context_lines;
    current.matches.push_back(matches[0]);

    for (size_t i = 1; i < matches.size(); i++) {
        const SearchMatch* m = matches[i];
        int start = std::max(1, m->line - context_lines);
        int end = m->line + context_lines;

        if (start <= current.end_line + 1) {
            current.end_line = std::max(current.end_line, end);
            current.matches.push_back(m);
        } else {
            ranges.push_back(std::move(current));
            current = MatchRange{};
            current.start_line = start;
            current.end_line = end;
            current.matches.push_back(m);
        }
    }
    ranges.push_back(std::move(current));
    return ranges;
}

std::string SearchProvider::range_content(const MatchRange& range) {
    // Rebuild the window by line number so overlapping contexts appear once.
    std::map<int, std::string> lines;
    for (const SearchMatch* m : range.matches) {
        int before_start = m->line - static_cast<int>(m->before.size());
        for (size_t i = 0; i < m->before.size(); i++) {
            lines.emplace(before_start + static_cast<int>(i), m->before[i]);
        }
        lines[m->line] = m->content;
        for (size_t i = 0; i < m->after.size(); i++) {
            lines.emplace(m->line + 1 + static_cast<int>(i), m->after[i]);
        }
    }

    std::string out;
    for (const auto& [ln, text] : lines) {
        if (!out.empty()) out += "\n";
        out += text;
    }
    return out;
}

std::vector<Evidence> SearchProvider::to_evidence(const std::vector<SearchMatch>& matches,
                                                  const Signal& signal,
                                                  int context_lines) const {
    std::vector<std::string> file_order;
    std::unordered_map<std::string, std::vector<const SearchMatch*>> by_file;
    for (const auto& m : matches) {
        auto& bucket = by_file[m.file];
        if (bucket.empty()) file_order.push_back(m.file);
        bucket.push_back(&m);
    }

    std::vector<Evidence> evidence;
    for (const auto& file : file_order) {
        for (const auto& range : merge_ranges(by_file[file], context_lines)) {
            Evidence ev;
            ev.id = util::generate_id("search");
            ev.provider = ProviderType::Search;
            ev.path = file;
            ev.range = {range.start_line, range.end_line};
            ev.content = range_content(range);
            ev.tokens = estimate_tokens(ev.content);

            int match_count = static_cast<int>(range.matches.size());
            ev.base_score = kBaseWeight * std::log2(static_cast<double>(match_count) + 1.0);
            ev.matched_signals = {signal};
            ev.metadata.match_count = match_count;
            evidence.push_back(std::move(ev));
        }
    }
    return evidence;
}

std::vector<Evidence> SearchProvider::query(const std::vector<Signal>& signals,
                                            const ProviderQueryOptions& options) {
    std::vector<Signal> searchable = searchable_signals(signals);
    if (searchable.empty() || !backend_) {
        return {};
    }

    auto includes = merge_patterns(config_.include_patterns, options.include_patterns);
    auto excludes = merge_patterns(config_.exclude_patterns, options.exclude_patterns);
    int context_lines = options.context_lines.value_or(config_.context_lines);

    std::vector<std::string> order;
    std::unordered_map<std::string, Evidence> by_key;

    for (const auto& signal : searchable) {
        if (options.cancel.is_cancelled()) {
            spdlog::debug("Search query cancelled");
            break;
        }

        std::optional<std::vector<SearchMatch>> matches;
        try {
            matches = backend_->search(build_request(signal, includes, excludes, context_lines));
        } catch (const std::exception& e) {
            spdlog::warn("Search for '{}' failed: {}", signal.value, e.what());
            continue;
        }
        if (!matches) continue;

        for (auto& item : to_evidence(*matches, signal, context_lines)) {
            std::string key = range_key(item);
            auto it = by_key.find(key);
            if (it == by_key.end()) {
                order.push_back(key);
                by_key.emplace(key, std::move(item));
                continue;
            }

            Evidence& existing = it->second;
            for (const auto& s : item.matched_signals) {
                bool seen = std::any_of(existing.matched_signals.begin(), existing.matched_signals.end(),
                                        [&](const Signal& ms) { return ms.same_fact(s); });
                if (!seen) existing.matched_signals.push_back(s);
            }
            existing.base_score = std::max(existing.base_score, item.base_score);
            existing.metadata.match_count = existing.metadata.match_count.value_or(1) +
                                            item.metadata.match_count.value_or(1);
        }
    }

    std::vector<Evidence> evidence;
    evidence.reserve(order.size());
    for (const auto& key : order) {
        evidence.push_back(std::move(by_key[key]));
    }

    std::stable_sort(evidence.begin(), evidence.end(),
                     [](const Evidence& a, const Evidence& b) { return a.base_score > b.base_score; });

    if (options.max_results && evidence.size() > *options.max_results) {
        evidence.resize(*options.max_results);
    }
    if (options.max_tokens) {
        evidence = apply_token_budget(std::move(evidence), *options.max_tokens);
    }
    return evidence;
}
