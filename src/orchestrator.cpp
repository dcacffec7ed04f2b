#include "orchestrator.hpp"
#include "signal_extractor.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <thread>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace {

constexpr std::chrono::milliseconds kWaitSlice{20};

struct QueryOutcome {
    bool available = false;
    std::vector<Evidence> evidence;
};

// One in-flight query. The thread may outlive the cycle after a timeout;
// it only touches the promise, the done flag and the provider.
struct PendingQuery {
    std::shared_ptr<EvidenceProvider> provider;
    size_t report_index = 0;
    CancellationToken cancel;
    std::future<QueryOutcome> future;
    std::chrono::steady_clock::time_point started;
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done = std::make_shared<std::atomic<bool>>(false);

    PendingQuery() = default;
    PendingQuery(PendingQuery&&) = default;
    PendingQuery& operator=(PendingQuery&&) = delete;

    // Only reached on an unwinding path; settled queries have no thread.
    ~PendingQuery() {
        if (thread.joinable()) {
            cancel.cancel();
            thread.join();
        }
    }
};

int64_t elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace

std::string to_string(ProviderStatus status) {
    switch (status) {
        case ProviderStatus::Ok: return "ok";
        case ProviderStatus::Unavailable: return "unavailable";
        case ProviderStatus::Empty: return "empty";
        case ProviderStatus::Timeout: return "timeout";
        case ProviderStatus::Failed: return "failed";
        case ProviderStatus::Cancelled: return "cancelled";
        case ProviderStatus::Skipped: return "skipped";
    }
    return "skipped";
}

nlohmann::json ProviderReport::to_json() const {
    nlohmann::json j = {
        {"name", name},
        {"type", to_string(type)},
        {"status", to_string(status)},
        {"count", count},
        {"tokens", tokens},
        {"elapsed_ms", elapsed_ms},
        {"budget", budget}
    };
    if (!error.empty()) j["error"] = error;
    return j;
}

nlohmann::json RetrievalResult::to_json() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& scored : evidence) {
        auto j = evidence_to_json(scored.evidence);
        j["score"] = scored.score;
        items.push_back(j);
    }
    nlohmann::json sigs = nlohmann::json::array();
    for (const auto& s : signals) sigs.push_back(signal_to_json(s));
    nlohmann::json reps = nlohmann::json::array();
    for (const auto& r : reports) reps.push_back(r.to_json());

    return {
        {"classification", classification.to_json()},
        {"strategy", strategy.to_json()},
        {"weights", weights.to_json()},
        {"signals", sigs},
        {"evidence", items},
        {"providers", reps},
        {"budget", budget},
        {"total_tokens", total_tokens},
        {"ts", util::current_iso8601()}
    };
}

std::string RetrievalResult::dump(int indent) const {
    return to_json().dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

EvidenceOrchestrator::~EvidenceOrchestrator() {
    std::lock_guard<std::mutex> lock(lingering_mutex_);
    for (auto& q : lingering_) q.cancel.cancel();
    for (auto& q : lingering_) {
        if (q.thread.joinable()) q.thread.join();
    }
    lingering_.clear();
}

size_t EvidenceOrchestrator::lingering_queries() const {
    reap_finished();
    std::lock_guard<std::mutex> lock(lingering_mutex_);
    return lingering_.size();
}

void EvidenceOrchestrator::reap_finished() const {
    std::lock_guard<std::mutex> lock(lingering_mutex_);
    auto it = lingering_.begin();
    while (it != lingering_.end()) {
        if (it->done->load()) {
            it->thread.join();
            it = lingering_.erase(it);
        } else {
            ++it;
        }
    }
}

EvidenceOrchestrator::EvidenceOrchestrator(std::vector<std::shared_ptr<EvidenceProvider>> providers,
                                           std::shared_ptr<IntentStrategyProvider> strategies,
                                           IntentClassifier classifier,
                                           OrchestratorConfig config)
    : providers_(std::move(providers)),
      strategies_(std::move(strategies)),
      classifier_(classifier),
      config_(config) {
    if (!strategies_) {
        strategies_ = std::make_shared<IntentStrategyProvider>();
    }
    if (config_.max_parallel == 0) config_.max_parallel = 1;
}

size_t EvidenceOrchestrator::sub_budget(size_t total, double ratio) {
    if (ratio <= 0.0) return 0;
    return static_cast<size_t>(std::floor(static_cast<double>(total) * std::min(ratio, 1.0)));
}

std::vector<std::shared_ptr<EvidenceProvider>> EvidenceOrchestrator::order_providers(
    const std::vector<ProviderType>& priority) const {
    std::vector<std::shared_ptr<EvidenceProvider>> ordered;
    std::unordered_set<const EvidenceProvider*> taken;

    for (auto type : priority) {
        for (const auto& p : providers_) {
            if (p && p->type() == type && taken.insert(p.get()).second) {
                ordered.push_back(p);
            }
        }
    }
    for (const auto& p : providers_) {
        if (p && taken.insert(p.get()).second) {
            ordered.push_back(p);
        }
    }
    return ordered;
}

std::vector<Signal> EvidenceOrchestrator::gather_signals(const RetrievalRequest& request) const {
    std::vector<Signal> signals = SignalExtractor::extract(request.task);

    auto add = [&signals](const Signal& s) {
        for (const auto& existing : signals) {
            if (existing.same_fact(s)) return;
        }
        signals.push_back(s);
    };
    for (const auto& s : request.signals) add(s);
    for (const auto& s : SignalExtractor::from_working_set(request.context.recent_files)) add(s);
    return signals;
}

std::vector<Evidence> EvidenceOrchestrator::fan_out(const std::vector<std::shared_ptr<EvidenceProvider>>& ordered,
                                                    const BudgetRatios& ratios,
                                                    size_t total_budget,
                                                    const std::vector<Signal>& signals,
                                                    const CancellationToken& cancel,
                                                    std::vector<ProviderReport>& reports) const {
    std::vector<Evidence> collected;
    auto cycle_start = std::chrono::steady_clock::now();
    auto cycle_deadline = cycle_start + config_.deadline;

    std::vector<size_t> runnable;
    for (const auto& provider : ordered) {
        ProviderReport report;
        report.name = provider->name();
        report.type = provider->type();
        report.budget = sub_budget(total_budget, ratios.for_provider(provider->type()));
        reports.push_back(report);
        if (report.budget == 0) {
            spdlog::debug("Provider '{}' skipped: zero budget", report.name);
            continue;
        }
        runnable.push_back(reports.size() - 1);
    }

    for (size_t batch_start = 0; batch_start < runnable.size(); batch_start += config_.max_parallel) {
        size_t batch_end = std::min(runnable.size(), batch_start + config_.max_parallel);

        std::vector<PendingQuery> batch;
        batch.reserve(batch_end - batch_start);
        for (size_t i = batch_start; i < batch_end; i++) {
            auto& report = reports[runnable[i]];
            if (cancel.is_cancelled()) {
                report.status = ProviderStatus::Cancelled;
                continue;
            }
            if (std::chrono::steady_clock::now() >= cycle_deadline) {
                report.status = ProviderStatus::Timeout;
                report.error = "retrieval deadline passed before query started";
                continue;
            }

            PendingQuery pending;
            pending.provider = ordered[runnable[i]];
            pending.report_index = runnable[i];
            pending.cancel = cancel.child();
            pending.started = std::chrono::steady_clock::now();

            ProviderQueryOptions options;
            options.max_results = config_.max_results;
            options.max_tokens = report.budget;
            options.cancel = pending.cancel;

            auto promise = std::make_shared<std::promise<QueryOutcome>>();
            pending.future = promise->get_future();

            batch.push_back(std::move(pending));
            batch.back().thread = std::thread([promise, done = batch.back().done,
                                               provider = batch.back().provider, signals, options]() {
                try {
                    QueryOutcome outcome;
                    outcome.available = provider->is_available();
                    if (outcome.available && !options.cancel.is_cancelled()) {
                        outcome.evidence = provider->query(signals, options);
                    }
                    promise->set_value(std::move(outcome));
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
                done->store(true);
            });
        }

        for (auto& pending : batch) {
            auto& report = reports[pending.report_index];
            auto provider_deadline = std::min(pending.started + config_.provider_timeout, cycle_deadline);
            bool finished = false;

            while (true) {
                if (pending.future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                    finished = true;
                    try {
                        auto outcome = pending.future.get();
                        if (!outcome.available) {
                            report.status = ProviderStatus::Unavailable;
                        } else if (outcome.evidence.empty()) {
                            report.status = pending.cancel.is_cancelled() ? ProviderStatus::Cancelled
                                                                          : ProviderStatus::Empty;
                        } else {
                            report.status = ProviderStatus::Ok;
                            report.count = outcome.evidence.size();
                            report.tokens = total_tokens(outcome.evidence);
                            for (auto& ev : outcome.evidence) collected.push_back(std::move(ev));
                        }
                    } catch (const std::exception& e) {
                        report.status = ProviderStatus::Failed;
                        report.error = e.what();
                        spdlog::warn("Provider '{}' failed: {}", report.name, e.what());
                    } catch (...) {
                        report.status = ProviderStatus::Failed;
                        report.error = "non-standard exception";
                        spdlog::warn("Provider '{}' failed with a non-standard exception", report.name);
                    }
                    break;
                }

                if (cancel.is_cancelled()) {
                    pending.cancel.cancel();
                    report.status = ProviderStatus::Cancelled;
                    spdlog::debug("Provider '{}' cancelled", report.name);
                    break;
                }

                auto now = std::chrono::steady_clock::now();
                if (now >= provider_deadline) {
                    pending.cancel.cancel();
                    report.status = ProviderStatus::Timeout;
                    spdlog::warn("Provider '{}' timed out after {}ms", report.name, elapsed_since(pending.started));
                    break;
                }

                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(provider_deadline - now);
                pending.future.wait_for(std::min(remaining + std::chrono::milliseconds(1), kWaitSlice));
            }

            report.elapsed_ms = elapsed_since(pending.started);

            if (finished) {
                pending.thread.join();
            } else {
                std::lock_guard<std::mutex> lock(lingering_mutex_);
                lingering_.push_back({std::move(pending.thread), pending.done, pending.cancel});
            }
        }
    }

    return collected;
}

RetrievalResult EvidenceOrchestrator::collect(const RetrievalRequest& request) {
    reap_finished();

    RetrievalResult result;
    result.budget = request.token_budget.value_or(config_.total_budget);

    result.classification = classifier_.classify_with_context(request.task, request.context);
    TaskIntent intent = result.classification.intent;
    result.strategy = strategies_->get_strategy(intent);
    result.weights = strategies_->apply_weight_modifiers(request.base_weights, intent);
    result.signals = gather_signals(request);

    spdlog::info("Retrieval for intent '{}' (confidence {:.2f}), {} signals, budget {}",
                 to_string(intent), result.classification.confidence,
                 result.signals.size(), result.budget);

    if (result.budget == 0) {
        return result;
    }

    auto ordered = order_providers(result.strategy.provider_priority);
    auto collected = fan_out(ordered, result.strategy.budget_ratios, result.budget,
                             result.signals, request.cancel, result.reports);

    Reranker reranker(result.weights, request.context.recent_files);
    auto ranked = reranker.rank(std::move(collected));

    // Same path and range from several providers: keep the higher score.
    std::unordered_set<std::string> seen;
    std::vector<ScoredEvidence> unique;
    for (auto& item : ranked) {
        if (seen.insert(range_key(item.evidence)).second) {
            unique.push_back(std::move(item));
        }
    }

    size_t used = 0;
    for (auto& item : unique) {
        if (!result.evidence.empty() && used + item.evidence.tokens > result.budget) break;
        used += item.evidence.tokens;
        result.evidence.push_back(std::move(item));
    }
    result.total_tokens = used;

    spdlog::info("Retrieval returned {} evidence items ({} tokens)", result.evidence.size(), used);
    return result;
}

void EvidenceOrchestrator::record_outcome(TaskIntent intent, const StrategyFeedback& feedback) {
    strategies_->update_strategy(intent, feedback);
}
