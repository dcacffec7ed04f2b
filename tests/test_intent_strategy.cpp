#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/intent_strategy.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

TEST_CASE("Default intent strategies", "[strategy]") {
    IntentStrategyProvider provider;

    SECTION("Every ratio set sums to about one") {
        for (auto intent : all_intents()) {
            auto r = provider.get_budget_ratios(intent);
            REQUIRE(std::abs(r.sum() - 1.0) <= 0.1);
            REQUIRE(r.diff >= 0.0);
            REQUIRE(r.lsp >= 0.0);
            REQUIRE(r.search >= 0.0);
        }
    }

    SECTION("Debug favors diffs and carries error context") {
        auto s = provider.get_strategy(TaskIntent::Debug);
        REQUIRE(s.budget_ratios.diff == Catch::Approx(0.5));
        REQUIRE(s.budget_ratios.lsp == Catch::Approx(0.3));
        REQUIRE(s.budget_ratios.search == Catch::Approx(0.2));
        REQUIRE(s.additional_context == std::vector<std::string>{"error_logs", "recent_changes"});
    }

    SECTION("Priorities per intent") {
        REQUIRE(provider.get_strategy(TaskIntent::Implement).provider_priority.front() == ProviderType::Lsp);
        REQUIRE(provider.get_strategy(TaskIntent::Refactor).provider_priority.front() == ProviderType::Lsp);
        REQUIRE(provider.get_strategy(TaskIntent::Explore).provider_priority.front() == ProviderType::Search);
        REQUIRE(provider.get_budget_ratios(TaskIntent::Review).diff >= 0.5);
    }

    SECTION("Unknown is balanced without additional context") {
        auto s = provider.get_strategy(TaskIntent::Unknown);
        REQUIRE_FALSE(s.additional_context.has_value());
        REQUIRE(s.weight_modifiers.empty());
        REQUIRE(std::abs(s.budget_ratios.diff - s.budget_ratios.lsp) < 0.05);
        REQUIRE(std::abs(s.budget_ratios.lsp - s.budget_ratios.search) < 0.05);
    }
}

TEST_CASE("Weight modifiers", "[strategy]") {
    IntentStrategyProvider provider;
    RerankerWeights base;
    base.diff = 100;
    base.stack_frame = 80;

    SECTION("Debug overrides diff and stack frame only") {
        auto w = provider.apply_weight_modifiers(base, TaskIntent::Debug);
        REQUIRE(w.diff == 150.0);
        REQUIRE(w.stack_frame == 120.0);
        REQUIRE(w.definition == base.definition);
        REQUIRE(w.reference == base.reference);
        REQUIRE(w.keyword == base.keyword);
        REQUIRE(w.working_set == base.working_set);
        REQUIRE(w.stack_depth_decay == base.stack_depth_decay);
        // input untouched
        REQUIRE(base.diff == 100.0);
    }

    SECTION("Untouched fields come from the caller, not from defaults") {
        RerankerWeights custom;
        custom.keyword = 3.0;
        custom.definition = 1.0;
        auto w = provider.apply_weight_modifiers(custom, TaskIntent::Debug);
        REQUIRE(w.keyword == 3.0);
        REQUIRE(w.definition == 1.0);
    }

    SECTION("Unknown leaves weights unchanged") {
        REQUIRE(provider.apply_weight_modifiers(base, TaskIntent::Unknown) == base);
    }
}

TEST_CASE("Strategy feedback", "[strategy]") {
    IntentStrategyProvider provider;

    SECTION("No data before the first report") {
        REQUIRE_FALSE(provider.get_feedback_stats(TaskIntent::Debug).has_value());
    }

    SECTION("Success rate follows reported outcomes") {
        provider.update_strategy(TaskIntent::Debug, {true, std::nullopt});
        provider.update_strategy(TaskIntent::Debug, {false, std::nullopt});
        provider.update_strategy(TaskIntent::Debug, {true, std::nullopt});

        auto stats = provider.get_feedback_stats(TaskIntent::Debug);
        REQUIRE(stats.has_value());
        REQUIRE(stats->sample_count == 3);
        REQUIRE(stats->success_rate == Catch::Approx(2.0 / 3.0));
        REQUIRE_FALSE(provider.get_feedback_stats(TaskIntent::Review).has_value());
    }

    SECTION("Adjustments replace whole fields and persist") {
        PartialIntentStrategy adj;
        adj.budget_ratios = BudgetRatios{0.8, 0.1, 0.1};
        provider.update_strategy(TaskIntent::Explore, {true, adj});

        auto s = provider.get_strategy(TaskIntent::Explore);
        REQUIRE(s.budget_ratios.diff == Catch::Approx(0.8));
        // other fields keep their defaults
        REQUIRE(s.provider_priority.front() == ProviderType::Search);
        REQUIRE(s.weight_modifiers.keyword == 30.0);
        REQUIRE(provider.get_strategy(TaskIntent::Explore).budget_ratios.diff == Catch::Approx(0.8));
    }

    SECTION("Reset clears feedback and adjustments") {
        PartialIntentStrategy adj;
        adj.provider_priority = std::vector<ProviderType>{ProviderType::Search};
        provider.update_strategy(TaskIntent::Debug, {false, adj});
        provider.reset();
        REQUIRE_FALSE(provider.get_feedback_stats(TaskIntent::Debug).has_value());
        REQUIRE(provider.get_strategy(TaskIntent::Debug).provider_priority.front() == ProviderType::Diff);
    }
}

TEST_CASE("Custom strategies", "[strategy]") {
    SECTION("Field-level merge over the defaults") {
        CustomStrategies custom;
        WeightModifiers mods;
        mods.keyword = 99.0;
        custom[TaskIntent::Debug].weight_modifiers = mods;

        IntentStrategyProvider provider(custom);
        auto s = provider.get_strategy(TaskIntent::Debug);
        // the whole modifier set is replaced, not interleaved
        REQUIRE(s.weight_modifiers.keyword == 99.0);
        REQUIRE_FALSE(s.weight_modifiers.diff.has_value());
        REQUIRE(s.budget_ratios.diff == Catch::Approx(0.5));
    }

    SECTION("Parsed from JSON") {
        auto j = nlohmann::json::parse(R"({
            "review": {
                "budget_ratios": {"diff": 0.7, "lsp": 0.2, "search": 0.1},
                "provider_priority": ["diff", "search", "lsp"],
                "additional_context": ["pr_description"]
            },
            "debug": {"weight_modifiers": {"stackFrame": 200}}
        })");
        IntentStrategyProvider provider(IntentStrategyProvider::parse_custom_strategies(j));

        auto review = provider.get_strategy(TaskIntent::Review);
        REQUIRE(review.budget_ratios.diff == Catch::Approx(0.7));
        REQUIRE(review.provider_priority[1] == ProviderType::Search);
        REQUIRE(review.additional_context == std::vector<std::string>{"pr_description"});
        REQUIRE(review.weight_modifiers.diff == 180.0);

        auto debug = provider.get_strategy(TaskIntent::Debug);
        REQUIRE(debug.weight_modifiers.stack_frame == 200.0);
    }

    SECTION("Invalid documents are rejected") {
        REQUIRE_THROWS_AS(IntentStrategyProvider::parse_custom_strategies(
            nlohmann::json::parse(R"({"deploy": {}})")), std::invalid_argument);
        REQUIRE_THROWS_AS(IntentStrategyProvider::parse_custom_strategies(
            nlohmann::json::parse(R"({"debug": {"budget_ratios": {"diff": 1.5}}})")), std::invalid_argument);
        REQUIRE_THROWS_AS(IntentStrategyProvider::parse_custom_strategies(
            nlohmann::json::parse(R"({"debug": {"budget_ratios": {"diff": 0.2, "lsp": 0.2, "search": 0.2}}})")),
            std::invalid_argument);
        REQUIRE_THROWS_AS(IntentStrategyProvider::parse_custom_strategies(
            nlohmann::json::parse(R"({"debug": {"weight_modifiers": {"speed": 1}}})")), std::invalid_argument);
        REQUIRE_THROWS_AS(IntentStrategyProvider::parse_custom_strategies(
            nlohmann::json::parse(R"({"debug": {"provider_priority": ["grep"]}})")), std::invalid_argument);
    }

    SECTION("Ratio sums within the tolerance load") {
        auto r = BudgetRatios::from_json(nlohmann::json::parse(R"({"diff": 0.5, "lsp": 0.3, "search": 0.25})"));
        REQUIRE(r.sum() == Catch::Approx(1.05));
        REQUIRE_THROWS_AS(BudgetRatios::from_json(nlohmann::json::parse(R"({"diff": 0.5})")),
                          std::invalid_argument);
    }

    SECTION("Loaded from a file") {
        auto path = std::filesystem::temp_directory_path() / "ctxrank-strategies.json";
        {
            std::ofstream out(path);
            out << R"({"implement": {"budget_ratios": {"diff": 0.1, "lsp": 0.8, "search": 0.1}}})";
        }
        auto custom = IntentStrategyProvider::load_custom_strategies_file(path.string());
        REQUIRE(custom.count(TaskIntent::Implement) == 1);
        std::filesystem::remove(path);

        REQUIRE_THROWS_AS(IntentStrategyProvider::load_custom_strategies_file("/nonexistent/ctxrank.json"),
                          std::runtime_error);
    }
}
