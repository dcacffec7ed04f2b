#include <catch2/catch_test_macros.hpp>
#include "../src/orchestrator.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>

namespace {

// Provider whose behavior is scripted per test.
class ScriptedProvider : public EvidenceProvider {
public:
    ScriptedProvider(ProviderType type, std::string name) : type_(type), name_(std::move(name)) {}

    ProviderType type() const override { return type_; }
    std::string name() const override { return name_; }
    double base_weight() const override { return 10.0; }

    bool is_available() override { return available; }

    std::vector<Evidence> query(const std::vector<Signal>&, const ProviderQueryOptions& options) override {
        calls++;
        last_max_tokens = options.max_tokens.value_or(0);
        if (throws) throw std::runtime_error("backend down");
        if (delay.count() > 0) {
            auto until = std::chrono::steady_clock::now() + delay;
            while (std::chrono::steady_clock::now() < until) {
                if (!ignores_cancel && options.cancel.is_cancelled()) {
                    saw_cancel = true;
                    return {};
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        }
        auto out = items;
        if (options.max_tokens) out = apply_token_budget(out, *options.max_tokens);
        finished = true;
        return out;
    }

    bool available = true;
    bool throws = false;
    std::chrono::milliseconds delay{0};
    std::vector<Evidence> items;
    std::atomic<int> calls{0};
    std::atomic<size_t> last_max_tokens{0};
    std::atomic<bool> saw_cancel{false};
    std::atomic<bool> finished{false};
    bool ignores_cancel = false;

private:
    ProviderType type_;
    std::string name_;
};

Evidence make_evidence(ProviderType provider, const std::string& path, double base, size_t tokens,
                       std::pair<int, int> range = {1, 10}) {
    Evidence ev;
    ev.id = path;
    ev.provider = provider;
    ev.path = path;
    ev.base_score = base;
    ev.tokens = tokens;
    ev.range = range;
    return ev;
}

const ProviderReport& report_for(const RetrievalResult& r, const std::string& name) {
    for (const auto& rep : r.reports) {
        if (rep.name == name) return rep;
    }
    throw std::runtime_error("no report for " + name);
}

struct Fixture {
    std::shared_ptr<ScriptedProvider> diff = std::make_shared<ScriptedProvider>(ProviderType::Diff, "diff");
    std::shared_ptr<ScriptedProvider> lsp = std::make_shared<ScriptedProvider>(ProviderType::Lsp, "lsp");
    std::shared_ptr<ScriptedProvider> search = std::make_shared<ScriptedProvider>(ProviderType::Search, "search");
    std::shared_ptr<IntentStrategyProvider> strategies = std::make_shared<IntentStrategyProvider>();

    EvidenceOrchestrator make(OrchestratorConfig cfg = OrchestratorConfig()) {
        return EvidenceOrchestrator({search, lsp, diff}, strategies, IntentClassifier(), cfg);
    }
};

} // namespace

TEST_CASE("Orchestrator budget split and ordering", "[orchestrator]") {
    Fixture f;
    f.diff->items = {make_evidence(ProviderType::Diff, "src/changed.ts", 100, 50)};
    f.search->items = {make_evidence(ProviderType::Search, "src/hit.ts", 10, 20)};
    auto lsp_item = make_evidence(ProviderType::Lsp, "src/def.ts", 60, 30);
    lsp_item.metadata.symbol_kind = SymbolKind::Definition;
    f.lsp->items = {lsp_item};

    OrchestratorConfig cfg;
    cfg.total_budget = 1000;
    auto orchestrator = f.make(cfg);

    RetrievalRequest request;
    request.task = "fix the crash in parser";
    auto result = orchestrator.collect(request);

    REQUIRE(result.classification.intent == TaskIntent::Debug);
    REQUIRE(result.weights.diff == 150.0);

    SECTION("Sub-budgets follow the intent ratios") {
        REQUIRE(f.diff->last_max_tokens.load() == 500);
        REQUIRE(f.lsp->last_max_tokens.load() == 300);
        REQUIRE(f.search->last_max_tokens.load() == 200);
        REQUIRE(report_for(result, "diff").budget == 500);
    }

    SECTION("Reports follow the priority order") {
        REQUIRE(result.reports.size() == 3);
        REQUIRE(result.reports[0].name == "diff");
        REQUIRE(result.reports[1].name == "lsp");
        REQUIRE(result.reports[2].name == "search");
        for (const auto& rep : result.reports) {
            REQUIRE(rep.status == ProviderStatus::Ok);
            REQUIRE(rep.count == 1);
        }
    }

    SECTION("Evidence is sorted by composite score") {
        REQUIRE(result.evidence.size() == 3);
        REQUIRE(result.evidence[0].evidence.path == "src/changed.ts");
        REQUIRE(result.evidence[1].evidence.path == "src/def.ts");
        REQUIRE(result.evidence[2].evidence.path == "src/hit.ts");
        for (size_t i = 1; i < result.evidence.size(); i++) {
            REQUIRE(result.evidence[i - 1].score >= result.evidence[i].score);
        }
        REQUIRE(result.total_tokens == 100);
    }

    SECTION("Result serializes") {
        auto j = result.to_json();
        REQUIRE(j["classification"]["intent"] == "debug");
        REQUIRE(j["evidence"].size() == 3);
        REQUIRE(j["providers"][0]["status"] == "ok");
    }
}

TEST_CASE("Orchestrator degrades per provider", "[orchestrator]") {
    Fixture f;
    f.diff->items = {make_evidence(ProviderType::Diff, "a.ts", 100, 10)};
    f.search->items = {make_evidence(ProviderType::Search, "b.ts", 10, 10)};

    RetrievalRequest request;
    request.task = "fix the bug";

    SECTION("A throwing provider is reported as failed") {
        f.lsp->throws = true;
        auto result = f.make().collect(request);
        REQUIRE(report_for(result, "lsp").status == ProviderStatus::Failed);
        REQUIRE(report_for(result, "lsp").error == "backend down");
        REQUIRE(result.evidence.size() == 2);
    }

    SECTION("Unavailable and empty providers") {
        f.lsp->available = false;
        f.search->items.clear();
        auto result = f.make().collect(request);
        REQUIRE(report_for(result, "lsp").status == ProviderStatus::Unavailable);
        REQUIRE(f.lsp->calls.load() == 0);
        REQUIRE(report_for(result, "search").status == ProviderStatus::Empty);
        REQUIRE(result.evidence.size() == 1);
    }

    SECTION("A slow provider times out without blocking the others") {
        f.lsp->delay = std::chrono::milliseconds(2000);
        OrchestratorConfig cfg;
        cfg.provider_timeout = std::chrono::milliseconds(100);

        auto start = std::chrono::steady_clock::now();
        auto result = f.make(cfg).collect(request);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(elapsed < std::chrono::milliseconds(1500));
        REQUIRE(report_for(result, "lsp").status == ProviderStatus::Timeout);
        REQUIRE(result.evidence.size() == 2);

        // the abandoned query observes its cancelled token
        for (int i = 0; i < 100 && !f.lsp->saw_cancel.load(); i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE(f.lsp->saw_cancel.load());
    }

    SECTION("All providers failing is an empty result, not an error") {
        f.diff->throws = true;
        f.lsp->throws = true;
        f.search->throws = true;
        auto result = f.make().collect(request);
        REQUIRE(result.evidence.empty());
        REQUIRE(result.total_tokens == 0);
    }
}

TEST_CASE("Orchestrator cancellation and limits", "[orchestrator]") {
    Fixture f;
    f.diff->items = {make_evidence(ProviderType::Diff, "a.ts", 100, 10)};
    RetrievalRequest request;
    request.task = "fix the bug";

    SECTION("Parent cancellation reaches in-flight queries") {
        f.diff->delay = std::chrono::milliseconds(3000);
        request.cancel.cancel();
        auto result = f.make().collect(request);
        for (const auto& rep : result.reports) {
            REQUIRE(rep.status == ProviderStatus::Cancelled);
        }
        REQUIRE(result.evidence.empty());
    }

    SECTION("Cancelling mid-cycle stops waiting") {
        f.diff->delay = std::chrono::milliseconds(3000);
        CancellationToken token;
        request.cancel = token;
        std::thread canceller([token]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            token.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        auto result = f.make().collect(request);
        canceller.join();
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(2000));
        REQUIRE(report_for(result, "diff").status == ProviderStatus::Cancelled);
    }

    SECTION("Zero-ratio providers are skipped") {
        PartialIntentStrategy adj;
        adj.budget_ratios = BudgetRatios{1.0, 0.0, 0.0};
        f.strategies->update_strategy(TaskIntent::Debug, {true, adj});
        auto result = f.make().collect(request);
        REQUIRE(report_for(result, "lsp").status == ProviderStatus::Skipped);
        REQUIRE(report_for(result, "search").status == ProviderStatus::Skipped);
        REQUIRE(f.lsp->calls.load() == 0);
    }

    SECTION("Zero total budget returns nothing") {
        request.token_budget = 0;
        auto result = f.make().collect(request);
        REQUIRE(result.evidence.empty());
        REQUIRE(f.diff->calls.load() == 0);
    }

    SECTION("Sequential mode queries one provider at a time") {
        OrchestratorConfig cfg;
        cfg.max_parallel = 1;
        f.search->items = {make_evidence(ProviderType::Search, "b.ts", 10, 10)};
        auto result = f.make(cfg).collect(request);
        REQUIRE(result.evidence.size() == 2);
    }
}

TEST_CASE("Orchestrator merging and trimming", "[orchestrator]") {
    Fixture f;
    RetrievalRequest request;
    request.task = "fix the bug";

    SECTION("Same path and range keeps the higher score") {
        f.diff->items = {make_evidence(ProviderType::Diff, "a.ts", 100, 10, {1, 20})};
        f.search->items = {make_evidence(ProviderType::Search, "a.ts", 10, 10, {1, 20})};
        auto result = f.make().collect(request);
        REQUIRE(result.evidence.size() == 1);
        REQUIRE(result.evidence[0].evidence.provider == ProviderType::Diff);
    }

    SECTION("Final list respects the total budget") {
        f.diff->items = {
            make_evidence(ProviderType::Diff, "a.ts", 100, 40),
            make_evidence(ProviderType::Diff, "b.ts", 100, 40),
            make_evidence(ProviderType::Diff, "c.ts", 100, 40),
        };
        request.token_budget = 100;
        auto result = f.make().collect(request);
        // diff sub-budget is 50
        REQUIRE(result.evidence.size() == 1);
        REQUIRE(result.total_tokens <= 100);
    }

    SECTION("An oversized first item is still returned") {
        f.diff->items = {make_evidence(ProviderType::Diff, "huge.ts", 100, 5000)};
        request.token_budget = 100;
        auto result = f.make().collect(request);
        REQUIRE(result.evidence.size() == 1);
    }

    SECTION("Non-UTF-8 file content still serializes") {
        auto latin1 = make_evidence(ProviderType::Diff, "legacy.c", 100, 10);
        latin1.content = "/* caf\xe9 */ int x;";
        f.diff->items = {latin1, make_evidence(ProviderType::Diff, "b.c", 90, 10, {30, 40})};
        auto result = f.make().collect(request);
        REQUIRE(result.evidence.size() == 2);

        std::string text;
        REQUIRE_NOTHROW(text = result.dump());
        REQUIRE(text.find("caf\xef\xbf\xbd */ int x;") != std::string::npos);
        REQUIRE(text.find("b.c") != std::string::npos);
    }

    SECTION("Outcome reports feed the strategy provider") {
        auto orchestrator = f.make();
        orchestrator.record_outcome(TaskIntent::Debug, {true, std::nullopt});
        REQUIRE(f.strategies->get_feedback_stats(TaskIntent::Debug)->sample_count == 1);
    }
}

TEST_CASE("Orchestrator owns timed-out query threads", "[orchestrator]") {
    Fixture f;
    f.diff->delay = std::chrono::milliseconds(300);
    f.diff->ignores_cancel = true;
    OrchestratorConfig cfg;
    cfg.provider_timeout = std::chrono::milliseconds(50);
    RetrievalRequest request;
    request.task = "fix the bug";

    SECTION("A finished query thread is joined on the next cycle") {
        auto orchestrator = f.make(cfg);
        auto first = orchestrator.collect(request);
        REQUIRE(report_for(first, "diff").status == ProviderStatus::Timeout);
        REQUIRE(orchestrator.lingering_queries() == 1);

        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        REQUIRE(f.diff->finished.load());
        f.diff->delay = std::chrono::milliseconds(0);
        orchestrator.collect(request);
        REQUIRE(orchestrator.lingering_queries() == 0);
    }

    SECTION("Destruction waits for a running query") {
        {
            auto orchestrator = f.make(cfg);
            orchestrator.collect(request);
            REQUIRE_FALSE(f.diff->finished.load());
        }
        REQUIRE(f.diff->finished.load());
    }

    SECTION("Completed queries never linger") {
        f.diff->delay = std::chrono::milliseconds(0);
        auto orchestrator = f.make(cfg);
        auto result = orchestrator.collect(request);
        REQUIRE(report_for(result, "diff").status == ProviderStatus::Empty);
        REQUIRE(orchestrator.lingering_queries() == 0);
    }
}

TEST_CASE("Orchestrator helpers", "[orchestrator]") {
    REQUIRE(EvidenceOrchestrator::sub_budget(1000, 0.33) == 330);
    REQUIRE(EvidenceOrchestrator::sub_budget(10, 0.34) == 3);
    REQUIRE(EvidenceOrchestrator::sub_budget(10, 0.0) == 0);

    Fixture f;
    auto orchestrator = f.make();
    auto ordered = orchestrator.order_providers({ProviderType::Lsp});
    REQUIRE(ordered.size() == 3);
    REQUIRE(ordered[0]->type() == ProviderType::Lsp);
    // unlisted keep registration order
    REQUIRE(ordered[1]->type() == ProviderType::Search);
    REQUIRE(ordered[2]->type() == ProviderType::Diff);
}
