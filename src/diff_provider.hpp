#pragma once

#include "evidence.hpp"
#include "snapshot_service.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Surfaces recently changed files as evidence. Recent edits are the most
// trusted source, hence the highest base weight.
class DiffProvider : public EvidenceProvider {
public:
    static constexpr double kBaseWeight = 100.0;

    explicit DiffProvider(std::shared_ptr<SnapshotService> service,
                          std::optional<std::string> snapshot_hash = std::nullopt);

    ProviderType type() const override { return ProviderType::Diff; }
    std::string name() const override { return "Git Diff"; }
    double base_weight() const override { return kBaseWeight; }

    bool is_available() override;
    std::vector<Evidence> query(const std::vector<Signal>& signals,
                                const ProviderQueryOptions& options) override;

    // No validation here; is_available() is the validation path.
    void set_snapshot_hash(const std::string& hash);
    std::optional<std::string> snapshot_hash() const;

private:
    std::shared_ptr<SnapshotService> service_;
    mutable std::mutex mutex_;
    std::optional<std::string> snapshot_hash_;

    static std::vector<Signal> match_signals(const FileDiff& diff, const std::vector<Signal>& signals);
    static bool path_matches(const std::string& path, const std::string& signal_value);
    Evidence build_evidence(const FileDiff& diff,
                            const std::vector<Signal>& matched,
                            const std::vector<Signal>& all_signals) const;
};
