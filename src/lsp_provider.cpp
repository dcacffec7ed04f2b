#include "lsp_provider.hpp"
#include "util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

} // namespace

LspProvider::LspProvider(LspProviderConfig config, std::shared_ptr<LspHub> hub)
    : config_(std::move(config)), hub_(std::move(hub)) {}

void LspProvider::set_hub(std::shared_ptr<LspHub> hub) {
    std::lock_guard<std::mutex> lock(mutex_);
    hub_ = std::move(hub);
}

std::shared_ptr<LspHub> LspProvider::hub() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hub_;
}

bool LspProvider::is_available() {
    auto h = hub();
    if (!h) return false;
    try {
        return h->is_initialized();
    } catch (const std::exception& e) {
        spdlog::warn("LSP hub availability check failed: {}", e.what());
        return false;
    }
}

std::string LspProvider::uri_to_path(const std::string& uri) {
    const std::string scheme = "file://";
    if (uri.compare(0, scheme.size(), scheme) != 0) {
        return uri;
    }
    std::string rest = uri.substr(scheme.size());
    // file://host/path: drop the authority part
    if (!rest.empty() && rest[0] != '/') {
        size_t slash = rest.find('/');
        rest = slash == std::string::npos ? "" : rest.substr(slash);
    }
    return percent_decode(rest);
}

std::string LspProvider::read_lines(const std::string& path, int start_line, int end_line) const {
    fs::path full = fs::path(path);
    if (full.is_relative()) full = fs::path(config_.workspace_root) / full;

    std::ifstream in(full);
    if (!in) return "";

    std::string out;
    std::string line;
    int n = 0;
    while (std::getline(in, line)) {
        n++;
        if (n < start_line) continue;
        if (n > end_line) break;
        if (!out.empty()) out += "\n";
        out += line;
    }
    return out;
}

std::vector<Evidence> LspProvider::locations_to_evidence(const std::vector<LspLocation>& locations,
                                                         const Signal& signal,
                                                         SymbolKind kind,
                                                         double weight,
                                                         const ProviderQueryOptions& options) const {
    std::vector<Evidence> evidence;
    int context_lines = options.context_lines.value_or(kDefaultContextLines);

    for (const auto& loc : locations) {
        std::string path = uri_to_path(loc.uri);
        if (path.empty() || !passes_filters(path, options)) continue;

        Evidence ev;
        ev.id = util::generate_id("lsp");
        ev.provider = ProviderType::Lsp;
        ev.path = path;
        ev.range = {std::max(1, loc.start.line + 1 - context_lines), loc.end.line + 1 + context_lines};

        ev.content = read_lines(path, ev.range.first, ev.range.second);
        if (ev.content.empty()) {
            ev.content = "[LSP " + to_string(kind) + ": " + signal.value + "]";
        }
        ev.tokens = estimate_tokens(ev.content);
        ev.base_score = weight * signal.confidence;
        ev.matched_signals = {signal};
        ev.metadata.symbol_kind = kind;
        evidence.push_back(std::move(ev));
    }
    return evidence;
}

std::vector<Evidence> LspProvider::query(const std::vector<Signal>& signals,
                                         const ProviderQueryOptions& options) {
    auto h = hub();
    if (!h) return {};

    size_t max_results = options.max_results.value_or(kDefaultMaxResults);
    std::vector<Evidence> evidence;

    for (const auto& signal : signals) {
        if (signal.type != SignalType::Symbol) continue;
        if (evidence.size() >= max_results) break;
        if (options.cancel.is_cancelled()) {
            spdlog::debug("LSP query cancelled");
            break;
        }

        auto path = signal.location_path();
        auto line = signal.location_line();
        if (!path || !line) continue;

        try {
            auto defs = h->definition(*path, *line, signal.location_character(), config_.definition_timeout);
            auto def_ev = locations_to_evidence(defs, signal, SymbolKind::Definition, kDefinitionWeight, options);
            evidence.insert(evidence.end(), def_ev.begin(), def_ev.end());

            auto refs = h->references(*path, *line, signal.location_character(), false,
                                      config_.reference_timeout);
            auto ref_ev = locations_to_evidence(refs, signal, SymbolKind::Reference, kReferenceWeight, options);
            evidence.insert(evidence.end(), ref_ev.begin(), ref_ev.end());
        } catch (const std::exception& e) {
            spdlog::debug("LSP lookup for '{}' failed: {}", signal.value, e.what());
        }
    }

    std::vector<Evidence> deduped;
    std::unordered_set<std::string> seen;
    for (auto& ev : evidence) {
        if (seen.insert(range_key(ev)).second) {
            deduped.push_back(std::move(ev));
        }
    }

    if (deduped.size() > max_results) {
        deduped.resize(max_results);
    }
    if (options.max_tokens) {
        deduped = apply_token_budget(std::move(deduped), *options.max_tokens);
    }
    return deduped;
}
