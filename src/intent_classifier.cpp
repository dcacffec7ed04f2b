#include "intent_classifier.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

std::string to_string(TaskIntent intent) {
    switch (intent) {
        case TaskIntent::Debug: return "debug";
        case TaskIntent::Implement: return "implement";
        case TaskIntent::Refactor: return "refactor";
        case TaskIntent::Explore: return "explore";
        case TaskIntent::Test: return "test";
        case TaskIntent::Review: return "review";
        case TaskIntent::Unknown: return "unknown";
    }
    return "unknown";
}

TaskIntent intent_from_string(const std::string& name) {
    std::string n = util::to_lower(util::trim(name));
    for (auto intent : all_intents()) {
        if (to_string(intent) == n) return intent;
    }
    throw std::invalid_argument("unknown intent: " + name);
}

const std::vector<TaskIntent>& all_intents() {
    static const std::vector<TaskIntent> intents = {
        TaskIntent::Debug, TaskIntent::Implement, TaskIntent::Refactor,
        TaskIntent::Explore, TaskIntent::Test, TaskIntent::Review, TaskIntent::Unknown
    };
    return intents;
}

nlohmann::json ClassificationResult::to_json() const {
    nlohmann::json j = {
        {"intent", to_string(intent)},
        {"confidence", confidence},
        {"signals", signals}
    };
    if (secondary_intent) {
        j["secondary_intent"] = to_string(*secondary_intent);
    }
    return j;
}

IntentClassifier::IntentClassifier(double min_confidence)
    : min_confidence_(min_confidence) {
    if (!(min_confidence >= 0.0 && min_confidence <= 1.0)) {
        throw std::invalid_argument("min_confidence must be within [0, 1]");
    }
}

// Row order is the tie-break order.
const std::vector<std::pair<TaskIntent, std::vector<std::string>>>& IntentClassifier::keyword_table() {
    static const std::vector<std::pair<TaskIntent, std::vector<std::string>>> table = {
        {TaskIntent::Debug, {
            "fix", "bug", "error", "crash", "broken", "fail", "failing", "failed",
            "exception", "typeerror", "referenceerror", "syntaxerror", "debug", "issue",
            "wrong", "undefined", "null", "stacktrace", "traceback", "panic", "segfault",
            "regression"
        }},
        {TaskIntent::Implement, {
            "implement", "add", "create", "build", "feature", "new", "support", "write",
            "introduce", "develop", "make", "generate"
        }},
        {TaskIntent::Test, {
            "test", "tests", "testing", "spec", "coverage", "unit", "integration", "e2e",
            "mock", "assert", "jest", "vitest"
        }},
        {TaskIntent::Refactor, {
            "refactor", "restructure", "rename", "extract", "cleanup", "clean", "simplify",
            "reorganize", "move", "optimize", "improve", "deduplicate", "modernize"
        }},
        {TaskIntent::Explore, {
            "explain", "understand", "how", "what", "where", "why", "find", "show",
            "explore", "overview", "describe", "look", "search", "learn"
        }},
        {TaskIntent::Review, {
            "review", "check", "audit", "inspect", "verify", "feedback", "approve",
            "critique", "evaluate"
        }}
    };
    return table;
}

std::vector<std::string> IntentClassifier::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

bool IntentClassifier::is_test_path(const std::string& path) {
    std::string p = util::normalize_path(path);
    auto slash = p.rfind('/');
    std::string file = slash == std::string::npos ? p : p.substr(slash + 1);

    return util::contains(file, ".test.") || util::contains(file, ".spec.") ||
           util::contains(file, "_test.") || file.rfind("test_", 0) == 0 ||
           util::contains(p, "__tests__/") || p.rfind("tests/", 0) == 0 ||
           util::contains(p, "/tests/") || p.rfind("test/", 0) == 0 ||
           util::contains(p, "/test/");
}

std::vector<IntentClassifier::IntentScore> IntentClassifier::score_tokens(
    const std::vector<std::string>& tokens) const {
    std::vector<IntentScore> scores;
    for (const auto& [intent, keywords] : keyword_table()) {
        IntentScore s{intent};
        for (const auto& kw : keywords) {
            bool exact = std::find(tokens.begin(), tokens.end(), kw) != tokens.end();
            if (exact) {
                s.score += 1.0;
                s.matched.push_back(kw);
                continue;
            }
            if (kw.size() < 3) continue;
            bool partial = std::any_of(tokens.begin(), tokens.end(), [&kw](const std::string& t) {
                return t.size() > kw.size() && util::contains(t, kw);
            });
            if (partial) {
                s.score += 0.5;
                s.matched.push_back(kw);
            }
        }
        scores.push_back(std::move(s));
    }
    return scores;
}

ClassificationResult IntentClassifier::decide(std::vector<IntentScore> scores, size_t token_count) const {
    ClassificationResult result;

    // Stable: equal scores keep table order.
    std::stable_sort(scores.begin(), scores.end(), [](const IntentScore& a, const IntentScore& b) {
        return a.score > b.score;
    });

    const auto& winner = scores.front();
    if (winner.score <= 0.0) {
        return result;
    }

    double denom = std::sqrt(static_cast<double>(std::max<size_t>(1, token_count)));
    result.confidence = std::min(1.0, winner.score / denom);
    result.signals = winner.matched;

    if (result.confidence < min_confidence_) {
        return result;
    }

    result.intent = winner.intent;
    if (scores.size() > 1) {
        const auto& runner_up = scores[1];
        if (runner_up.score > 0.0 && runner_up.score >= kSecondaryRatio * winner.score) {
            result.secondary_intent = runner_up.intent;
        }
    }
    return result;
}

ClassificationResult IntentClassifier::classify(const std::string& text) const {
    return classify_with_context(text, ClassificationContext{});
}

ClassificationResult IntentClassifier::classify_with_context(const std::string& text,
                                                             const ClassificationContext& context) const {
    if (util::trim(text).empty()) {
        return ClassificationResult{};
    }

    auto tokens = tokenize(text);
    auto scores = score_tokens(tokens);

    auto boost = [&scores](TaskIntent intent, double amount, const std::string& label) {
        for (auto& s : scores) {
            if (s.intent == intent) {
                s.score += amount;
                s.matched.push_back(label);
            }
        }
    };

    std::vector<std::string> context_signals;
    if (context.error_present) {
        boost(TaskIntent::Debug, kErrorBoost, "context:errorPresent");
        context_signals.push_back("context:errorPresent");
    }
    if (context.test_file) {
        boost(TaskIntent::Test, kTestFileBoost, "context:testFile");
        context_signals.push_back("context:testFile");
    }
    bool recent_tests = std::any_of(context.recent_files.begin(), context.recent_files.end(),
                                    [](const std::string& f) { return is_test_path(f); });
    if (recent_tests) {
        boost(TaskIntent::Test, kRecentTestFilesBoost, "context:recentTestFiles");
        context_signals.push_back("context:recentTestFiles");
    }

    auto result = decide(std::move(scores), tokens.size());

    // Every applied boost is reported, whichever intent won.
    for (const auto& label : context_signals) {
        if (std::find(result.signals.begin(), result.signals.end(), label) == result.signals.end()) {
            result.signals.push_back(label);
        }
    }
    return result;
}
