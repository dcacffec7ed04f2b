#include "intent_strategy.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace {

constexpr double kRatioSumTolerance = 0.1;

double ratio_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return 0.0;
    const auto& v = j.at(key);
    if (!v.is_number()) {
        throw std::invalid_argument(std::string("budget ratio '") + key + "' must be a number");
    }
    double r = v.get<double>();
    if (r < 0.0 || r > 1.0) {
        throw std::invalid_argument(std::string("budget ratio '") + key + "' must be within [0, 1]");
    }
    return r;
}

} // namespace

double BudgetRatios::for_provider(ProviderType type) const {
    switch (type) {
        case ProviderType::Diff: return diff;
        case ProviderType::Lsp: return lsp;
        case ProviderType::Search: return search;
    }
    return 0.0;
}

BudgetRatios BudgetRatios::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("budget_ratios must be an object");
    }
    BudgetRatios r;
    r.diff = ratio_field(j, "diff");
    r.lsp = ratio_field(j, "lsp");
    r.search = ratio_field(j, "search");
    if (std::abs(r.sum() - 1.0) > kRatioSumTolerance) {
        throw std::invalid_argument("budget ratios must sum to 1 (got " + std::to_string(r.sum()) + ")");
    }
    return r;
}

nlohmann::json BudgetRatios::to_json() const {
    return {{"diff", diff}, {"lsp", lsp}, {"search", search}};
}

nlohmann::json IntentStrategy::to_json() const {
    nlohmann::json priority = nlohmann::json::array();
    for (auto p : provider_priority) priority.push_back(to_string(p));

    nlohmann::json j = {
        {"budget_ratios", budget_ratios.to_json()},
        {"weight_modifiers", weight_modifiers.to_json()},
        {"provider_priority", priority}
    };
    if (additional_context) {
        j["additional_context"] = *additional_context;
    }
    return j;
}

void PartialIntentStrategy::merge_into(IntentStrategy& strategy) const {
    if (budget_ratios) strategy.budget_ratios = *budget_ratios;
    if (weight_modifiers) strategy.weight_modifiers = *weight_modifiers;
    if (provider_priority) strategy.provider_priority = *provider_priority;
    if (additional_context) strategy.additional_context = *additional_context;
}

PartialIntentStrategy PartialIntentStrategy::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("strategy must be an object");
    }
    PartialIntentStrategy p;
    if (j.contains("budget_ratios")) {
        p.budget_ratios = BudgetRatios::from_json(j.at("budget_ratios"));
    }
    if (j.contains("weight_modifiers")) {
        p.weight_modifiers = WeightModifiers::from_json(j.at("weight_modifiers"));
    }
    if (j.contains("provider_priority")) {
        std::vector<ProviderType> order;
        for (const auto& name : j.at("provider_priority")) {
            order.push_back(provider_type_from_string(name.get<std::string>()));
        }
        p.provider_priority = order;
    }
    if (j.contains("additional_context")) {
        p.additional_context = j.at("additional_context").get<std::vector<std::string>>();
    }
    return p;
}

IntentStrategy IntentStrategyProvider::default_strategy(TaskIntent intent) {
    IntentStrategy s;
    switch (intent) {
        case TaskIntent::Debug:
            s.budget_ratios = {0.5, 0.3, 0.2};
            s.weight_modifiers.diff = 150.0;
            s.weight_modifiers.stack_frame = 120.0;
            s.provider_priority = {ProviderType::Diff, ProviderType::Lsp, ProviderType::Search};
            s.additional_context = std::vector<std::string>{"error_logs", "recent_changes"};
            break;
        case TaskIntent::Implement:
            s.budget_ratios = {0.2, 0.5, 0.3};
            s.weight_modifiers.definition = 80.0;
            s.weight_modifiers.reference = 40.0;
            s.provider_priority = {ProviderType::Lsp, ProviderType::Search, ProviderType::Diff};
            s.additional_context = std::vector<std::string>{"type_definitions", "similar_implementations"};
            break;
        case TaskIntent::Refactor:
            s.budget_ratios = {0.2, 0.6, 0.2};
            s.weight_modifiers.definition = 70.0;
            s.weight_modifiers.reference = 60.0;
            s.provider_priority = {ProviderType::Lsp, ProviderType::Diff, ProviderType::Search};
            s.additional_context = std::vector<std::string>{"all_references"};
            break;
        case TaskIntent::Explore:
            s.budget_ratios = {0.1, 0.3, 0.6};
            s.weight_modifiers.keyword = 30.0;
            s.provider_priority = {ProviderType::Search, ProviderType::Lsp, ProviderType::Diff};
            s.additional_context = std::vector<std::string>{"project_structure"};
            break;
        case TaskIntent::Test:
            s.budget_ratios = {0.3, 0.4, 0.3};
            s.weight_modifiers.definition = 70.0;
            s.weight_modifiers.working_set = 40.0;
            s.provider_priority = {ProviderType::Lsp, ProviderType::Diff, ProviderType::Search};
            s.additional_context = std::vector<std::string>{"test_files", "test_utilities"};
            break;
        case TaskIntent::Review:
            s.budget_ratios = {0.6, 0.3, 0.1};
            s.weight_modifiers.diff = 180.0;
            s.provider_priority = {ProviderType::Diff, ProviderType::Lsp, ProviderType::Search};
            s.additional_context = std::vector<std::string>{"recent_changes"};
            break;
        case TaskIntent::Unknown:
            s.budget_ratios = {0.34, 0.33, 0.33};
            s.provider_priority = {ProviderType::Diff, ProviderType::Lsp, ProviderType::Search};
            break;
    }
    return s;
}

IntentStrategyProvider::IntentStrategyProvider(CustomStrategies custom)
    : custom_(std::move(custom)) {
    live_ = build_initial();
}

std::map<TaskIntent, IntentStrategy> IntentStrategyProvider::build_initial() const {
    std::map<TaskIntent, IntentStrategy> strategies;
    for (auto intent : all_intents()) {
        IntentStrategy s = default_strategy(intent);
        auto it = custom_.find(intent);
        if (it != custom_.end()) {
            it->second.merge_into(s);
        }
        strategies[intent] = s;
    }
    return strategies;
}

IntentStrategy IntentStrategyProvider::get_strategy(TaskIntent intent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.at(intent);
}

RerankerWeights IntentStrategyProvider::apply_weight_modifiers(const RerankerWeights& base,
                                                               TaskIntent intent) const {
    return get_strategy(intent).weight_modifiers.apply(base);
}

BudgetRatios IntentStrategyProvider::get_budget_ratios(TaskIntent intent) const {
    return get_strategy(intent).budget_ratios;
}

void IntentStrategyProvider::update_strategy(TaskIntent intent, const StrategyFeedback& feedback) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& record = feedback_[intent];
    record.sample_count++;
    if (feedback.success) record.success_count++;

    if (feedback.adjustments) {
        feedback.adjustments->merge_into(live_.at(intent));
        spdlog::info("Strategy for '{}' adjusted: {}", to_string(intent), live_.at(intent).to_json().dump());
    }

    spdlog::debug("Feedback for '{}': {}/{} successful",
                  to_string(intent), record.success_count, record.sample_count);
}

std::optional<FeedbackStats> IntentStrategyProvider::get_feedback_stats(TaskIntent intent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = feedback_.find(intent);
    if (it == feedback_.end() || it->second.sample_count == 0) {
        return std::nullopt;
    }
    FeedbackStats stats;
    stats.sample_count = it->second.sample_count;
    stats.success_rate = static_cast<double>(it->second.success_count) / it->second.sample_count;
    return stats;
}

void IntentStrategyProvider::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    feedback_.clear();
    live_ = build_initial();
}

CustomStrategies IntentStrategyProvider::parse_custom_strategies(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("custom strategies must be a JSON object keyed by intent");
    }
    CustomStrategies custom;
    for (const auto& [name, value] : j.items()) {
        custom[intent_from_string(name)] = PartialIntentStrategy::from_json(value);
    }
    return custom;
}

CustomStrategies IntentStrategyProvider::load_custom_strategies_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open strategy file: " + path);
    }
    nlohmann::json j = nlohmann::json::parse(in);
    auto custom = parse_custom_strategies(j);
    spdlog::info("Loaded {} custom strategies from {}", custom.size(), path);
    return custom;
}
