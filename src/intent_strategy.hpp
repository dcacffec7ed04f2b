#pragma once

#include "evidence.hpp"
#include "intent_classifier.hpp"
#include "reranker.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct BudgetRatios {
    double diff = 0.0;
    double lsp = 0.0;
    double search = 0.0;

    double sum() const { return diff + lsp + search; }
    double for_provider(ProviderType type) const;

    // Throws std::invalid_argument for ratios outside [0, 1].
    static BudgetRatios from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct IntentStrategy {
    BudgetRatios budget_ratios;
    WeightModifiers weight_modifiers;
    std::vector<ProviderType> provider_priority;
    std::optional<std::vector<std::string>> additional_context;

    nlohmann::json to_json() const;
};

// Every top-level field is taken whole from here when set.
struct PartialIntentStrategy {
    std::optional<BudgetRatios> budget_ratios;
    std::optional<WeightModifiers> weight_modifiers;
    std::optional<std::vector<ProviderType>> provider_priority;
    std::optional<std::vector<std::string>> additional_context;

    void merge_into(IntentStrategy& strategy) const;
    static PartialIntentStrategy from_json(const nlohmann::json& j);
};

struct StrategyFeedback {
    bool success = false;
    std::optional<PartialIntentStrategy> adjustments;
};

struct FeedbackStats {
    int sample_count = 0;
    double success_rate = 0.0;
};

using CustomStrategies = std::map<TaskIntent, PartialIntentStrategy>;

// Maps an intent to budget ratios, weight overrides and provider order.
// Feedback and live adjustments are per instance and guarded by one mutex.
class IntentStrategyProvider {
public:
    explicit IntentStrategyProvider(CustomStrategies custom = {});

    IntentStrategy get_strategy(TaskIntent intent) const;
    RerankerWeights apply_weight_modifiers(const RerankerWeights& base, TaskIntent intent) const;
    BudgetRatios get_budget_ratios(TaskIntent intent) const;

    void update_strategy(TaskIntent intent, const StrategyFeedback& feedback);
    std::optional<FeedbackStats> get_feedback_stats(TaskIntent intent) const;

    // Drops feedback and live adjustments, keeping construction-time customs.
    void reset();

    static IntentStrategy default_strategy(TaskIntent intent);

    // JSON object keyed by intent name; see load_custom_strategies_file.
    static CustomStrategies parse_custom_strategies(const nlohmann::json& j);
    static CustomStrategies load_custom_strategies_file(const std::string& path);

private:
    struct FeedbackRecord {
        int sample_count = 0;
        int success_count = 0;
    };

    CustomStrategies custom_;
    mutable std::mutex mutex_;
    std::map<TaskIntent, IntentStrategy> live_;
    std::map<TaskIntent, FeedbackRecord> feedback_;

    std::map<TaskIntent, IntentStrategy> build_initial() const;
};
