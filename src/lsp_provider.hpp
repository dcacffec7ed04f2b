#pragma once

#include "evidence.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct LspPosition {
    int line = 0;       // 0-based, as on the wire
    int character = 0;
};

struct LspLocation {
    std::string uri;
    LspPosition start;
    LspPosition end;
};

// Narrow view of the language-server hub. Implementations enforce the
// timeout they are given and throw on transport errors.
class LspHub {
public:
    virtual ~LspHub() = default;

    virtual bool is_initialized() const = 0;
    virtual std::vector<LspLocation> definition(const std::string& file_path, int line, int character,
                                                std::chrono::milliseconds timeout) = 0;
    virtual std::vector<LspLocation> references(const std::string& file_path, int line, int character,
                                                bool include_declaration,
                                                std::chrono::milliseconds timeout) = 0;
};

struct LspProviderConfig {
    std::string workspace_root = ".";
    std::chrono::milliseconds definition_timeout{5000};
    std::chrono::milliseconds reference_timeout{10000};
};

// Definition and reference evidence for positioned symbol signals.
class LspProvider : public EvidenceProvider {
public:
    static constexpr double kDefinitionWeight = 60.0;
    static constexpr double kReferenceWeight = 30.0;
    static constexpr int kDefaultContextLines = 5;
    static constexpr size_t kDefaultMaxResults = 50;

    explicit LspProvider(LspProviderConfig config, std::shared_ptr<LspHub> hub = nullptr);

    ProviderType type() const override { return ProviderType::Lsp; }
    std::string name() const override { return "LSP Analysis"; }
    double base_weight() const override { return kDefinitionWeight; }

    bool is_available() override;
    std::vector<Evidence> query(const std::vector<Signal>& signals,
                                const ProviderQueryOptions& options) override;

    // Late binding for when the language servers come up after construction.
    void set_hub(std::shared_ptr<LspHub> hub);

    static std::string uri_to_path(const std::string& uri);

private:
    LspProviderConfig config_;
    mutable std::mutex mutex_;
    std::shared_ptr<LspHub> hub_;

    std::shared_ptr<LspHub> hub() const;
    std::vector<Evidence> locations_to_evidence(const std::vector<LspLocation>& locations,
                                                const Signal& signal,
                                                SymbolKind kind,
                                                double weight,
                                                const ProviderQueryOptions& options) const;
    std::string read_lines(const std::string& path, int start_line, int end_line) const;
};
