#pragma once

#include "evidence.hpp"
#include "search_backend.hpp"
#include <memory>
#include <string>
#include <vector>

struct SearchProviderConfig {
    std::string workspace_root = ".";
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    size_t max_results_per_signal = 10;
    int context_lines = 3;
};

// Keyword evidence from full-text search over symbol and error-token signals.
class SearchProvider : public EvidenceProvider {
public:
    static constexpr double kBaseWeight = 10.0;

    SearchProvider(SearchProviderConfig config, std::shared_ptr<SearchBackend> backend);

    ProviderType type() const override { return ProviderType::Search; }
    std::string name() const override { return "Code Search"; }
    double base_weight() const override { return kBaseWeight; }

    bool is_available() override;
    std::vector<Evidence> query(const std::vector<Signal>& signals,
                                const ProviderQueryOptions& options) override;

private:
    struct MatchRange {
        int start_line = 1;
        int end_line = 1;
        std::vector<const SearchMatch*> matches;
    };

    SearchProviderConfig config_;
    std::shared_ptr<SearchBackend> backend_;

    static std::vector<Signal> searchable_signals(const std::vector<Signal>& signals);
    SearchRequest build_request(const Signal& signal,
                                const std::vector<std::string>& includes,
                                const std::vector<std::string>& excludes,
                                int context_lines) const;
    std::vector<Evidence> to_evidence(const std::vector<SearchMatch>& matches,
                                      const Signal& signal,
                                      int context_lines) const;

    static std::vector<MatchRange> merge_ranges(std::vector<const SearchMatch*> matches, int context_lines);
    static std::string range_content(const MatchRange& range);
    static std::vector<std::string> merge_patterns(const std::vector<std::string>& base,
                                                   const std::vector<std::string>& extra);
};
