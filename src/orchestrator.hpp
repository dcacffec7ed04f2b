#pragma once

#include "cancellation.hpp"
#include "evidence.hpp"
#include "intent_classifier.hpp"
#include "intent_strategy.hpp"
#include "reranker.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

struct OrchestratorConfig {
    size_t total_budget = 8000;
    std::chrono::milliseconds provider_timeout{5000};
    std::chrono::milliseconds deadline{15000};
    size_t max_parallel = 3;
    size_t max_results = 50;
};

struct RetrievalRequest {
    std::string task;
    ClassificationContext context;
    std::vector<Signal> signals;         // in addition to those extracted from the task
    std::optional<size_t> token_budget;  // overrides OrchestratorConfig::total_budget
    RerankerWeights base_weights;
    CancellationToken cancel;
};

enum class ProviderStatus {
    Ok,
    Unavailable,
    Empty,
    Timeout,
    Failed,
    Cancelled,
    Skipped
};

std::string to_string(ProviderStatus status);

struct ProviderReport {
    std::string name;
    ProviderType type = ProviderType::Diff;
    ProviderStatus status = ProviderStatus::Skipped;
    size_t count = 0;
    size_t tokens = 0;
    int64_t elapsed_ms = 0;
    size_t budget = 0;
    std::string error;

    nlohmann::json to_json() const;
};

struct RetrievalResult {
    ClassificationResult classification;
    IntentStrategy strategy;
    RerankerWeights weights;
    std::vector<Signal> signals;
    std::vector<ScoredEvidence> evidence;  // composite score, descending
    std::vector<ProviderReport> reports;   // query order
    size_t budget = 0;
    size_t total_tokens = 0;

    nlohmann::json to_json() const;
    // Evidence holds raw file bytes; invalid UTF-8 is replaced, not thrown.
    std::string dump(int indent = 2) const;
};

// One retrieval cycle: classify, pick a strategy, split the budget, fan out
// to providers with per-provider deadlines, then rerank and trim.
//
// A query that misses its deadline is cancelled and its thread kept here
// until it returns. Finished ones are joined at the start of the next cycle;
// the destructor cancels and joins whatever is left, so at most one thread
// per timed-out query lives past a cycle and none past the orchestrator.
class EvidenceOrchestrator {
public:
    EvidenceOrchestrator(std::vector<std::shared_ptr<EvidenceProvider>> providers,
                         std::shared_ptr<IntentStrategyProvider> strategies,
                         IntentClassifier classifier = IntentClassifier(),
                         OrchestratorConfig config = OrchestratorConfig());
    ~EvidenceOrchestrator();

    EvidenceOrchestrator(const EvidenceOrchestrator&) = delete;
    EvidenceOrchestrator& operator=(const EvidenceOrchestrator&) = delete;

    RetrievalResult collect(const RetrievalRequest& request);

    void record_outcome(TaskIntent intent, const StrategyFeedback& feedback);

    // Providers sorted by the priority list; unlisted types keep their
    // registration order after the listed ones.
    std::vector<std::shared_ptr<EvidenceProvider>> order_providers(
        const std::vector<ProviderType>& priority) const;

    static size_t sub_budget(size_t total, double ratio);

    const OrchestratorConfig& config() const { return config_; }

    // Timed-out queries whose threads have not been joined yet.
    size_t lingering_queries() const;

private:
    struct QueryThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
        CancellationToken cancel;
    };

    std::vector<std::shared_ptr<EvidenceProvider>> providers_;
    std::shared_ptr<IntentStrategyProvider> strategies_;
    IntentClassifier classifier_;
    OrchestratorConfig config_;

    mutable std::mutex lingering_mutex_;
    mutable std::vector<QueryThread> lingering_;

    void reap_finished() const;
    std::vector<Signal> gather_signals(const RetrievalRequest& request) const;
    std::vector<Evidence> fan_out(const std::vector<std::shared_ptr<EvidenceProvider>>& ordered,
                                  const BudgetRatios& ratios,
                                  size_t total_budget,
                                  const std::vector<Signal>& signals,
                                  const CancellationToken& cancel,
                                  std::vector<ProviderReport>& reports) const;
};
