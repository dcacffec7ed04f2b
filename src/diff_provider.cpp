#include "diff_provider.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

const std::string& searchable_content(const FileDiff& diff) {
    static const std::string empty;
    if (diff.type == FileChangeType::Deleted) {
        return diff.before_content ? *diff.before_content : empty;
    }
    if (diff.after_content) return *diff.after_content;
    return diff.before_content ? *diff.before_content : empty;
}

ChangeType collapse_change_type(FileChangeType type) {
    switch (type) {
        case FileChangeType::Added: return ChangeType::Added;
        case FileChangeType::Deleted: return ChangeType::Deleted;
        case FileChangeType::Modified:
        case FileChangeType::Renamed:
            return ChangeType::Modified;
    }
    return ChangeType::Modified;
}

} // namespace

DiffProvider::DiffProvider(std::shared_ptr<SnapshotService> service,
                           std::optional<std::string> snapshot_hash)
    : service_(std::move(service)), snapshot_hash_(std::move(snapshot_hash)) {}

void DiffProvider::set_snapshot_hash(const std::string& hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_hash_ = hash;
}

std::optional<std::string> DiffProvider::snapshot_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_hash_;
}

bool DiffProvider::is_available() {
    auto hash = snapshot_hash();
    if (!hash || !service_) return false;

    try {
        return service_->patch(*hash).has_value();
    } catch (const std::exception& e) {
        spdlog::warn("Diff availability check failed: {}", e.what());
        return false;
    }
}

bool DiffProvider::path_matches(const std::string& path, const std::string& signal_value) {
    std::string p = util::normalize_path(path);
    std::string s = util::normalize_path(signal_value);
    if (s.empty()) return false;
    return p == s || util::ends_with(p, "/" + s) || util::contains(p, s);
}

std::vector<Signal> DiffProvider::match_signals(const FileDiff& diff, const std::vector<Signal>& signals) {
    std::vector<Signal> matched;
    const std::string& content = searchable_content(diff);

    for (const auto& signal : signals) {
        bool hit = false;
        switch (signal.type) {
            case SignalType::Path:
                hit = path_matches(diff.path, signal.value) ||
                      (diff.old_path && path_matches(*diff.old_path, signal.value));
                break;
            case SignalType::Symbol:
                hit = util::contains_word(content, signal.value);
                break;
            case SignalType::ErrorToken:
                hit = !signal.value.empty() && util::contains_ci(content, signal.value);
                break;
        }
        if (hit) matched.push_back(signal);
    }
    return matched;
}

Evidence DiffProvider::build_evidence(const FileDiff& diff,
                                      const std::vector<Signal>& matched,
                                      const std::vector<Signal>& all_signals) const {
    Evidence ev;
    ev.id = util::generate_id("diff");
    ev.provider = ProviderType::Diff;
    ev.path = diff.path;

    if (diff.type == FileChangeType::Deleted) {
        ev.content = diff.before_content.value_or("");
    } else {
        ev.content = diff.after_content.value_or("");
    }

    size_t lines = util::count_lines(ev.content);
    ev.range = {1, static_cast<int>(lines > 0 ? lines : 1)};
    ev.tokens = estimate_tokens(ev.content);
    ev.base_score = kBaseWeight;
    ev.matched_signals = matched.empty() ? all_signals : matched;
    ev.metadata.change_type = collapse_change_type(diff.type);
    return ev;
}

std::vector<Evidence> DiffProvider::query(const std::vector<Signal>& signals,
                                          const ProviderQueryOptions& options) {
    auto hash = snapshot_hash();
    if (!hash || !service_) {
        return {};
    }

    std::optional<std::vector<FileDiff>> diffs;
    try {
        diffs = service_->diff_full(*hash);
    } catch (const std::exception& e) {
        spdlog::warn("Diff backend failed for {}: {}", *hash, e.what());
        return {};
    }
    if (!diffs) {
        spdlog::debug("Diff backend returned no diff for {}", *hash);
        return {};
    }

    std::vector<Evidence> evidence;
    for (const auto& diff : *diffs) {
        if (options.cancel.is_cancelled()) {
            spdlog::debug("Diff query cancelled after {} files", evidence.size());
            break;
        }

        if (!passes_filters(diff.path, options)) continue;

        std::vector<Signal> matched = match_signals(diff, signals);
        if (!signals.empty() && matched.empty()) continue;

        evidence.push_back(build_evidence(diff, matched, signals));
    }

    if (options.max_results && evidence.size() > *options.max_results) {
        evidence.resize(*options.max_results);
    }
    if (options.max_tokens) {
        evidence = apply_token_budget(std::move(evidence), *options.max_tokens);
    }

    spdlog::debug("Diff provider: {} of {} changed files selected", evidence.size(), diffs->size());
    return evidence;
}
