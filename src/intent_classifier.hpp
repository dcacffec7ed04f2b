#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

enum class TaskIntent {
    Debug,
    Implement,
    Refactor,
    Explore,
    Test,
    Review,
    Unknown
};

std::string to_string(TaskIntent intent);
// Throws std::invalid_argument for names outside the enumeration.
TaskIntent intent_from_string(const std::string& name);
const std::vector<TaskIntent>& all_intents();

struct ClassificationContext {
    bool error_present = false;
    bool test_file = false;
    std::vector<std::string> recent_files;
};

struct ClassificationResult {
    TaskIntent intent = TaskIntent::Unknown;
    double confidence = 0.0;
    std::vector<std::string> signals;
    std::optional<TaskIntent> secondary_intent;

    nlohmann::json to_json() const;
};

// Keyword scoring over lowercased tokens. Exact token hits count 1, a
// keyword found inside a longer token counts 0.5; confidence is the raw
// score over sqrt(token count), capped at 1.
class IntentClassifier {
public:
    static constexpr double kDefaultMinConfidence = 0.15;
    static constexpr double kErrorBoost = 1.5;
    static constexpr double kTestFileBoost = 1.5;
    static constexpr double kRecentTestFilesBoost = 1.0;
    static constexpr double kSecondaryRatio = 0.7;

    explicit IntentClassifier(double min_confidence = kDefaultMinConfidence);

    ClassificationResult classify(const std::string& text) const;
    ClassificationResult classify_with_context(const std::string& text,
                                               const ClassificationContext& context) const;

    double min_confidence() const { return min_confidence_; }

    static std::vector<std::string> tokenize(const std::string& text);
    static bool is_test_path(const std::string& path);

private:
    struct IntentScore {
        TaskIntent intent;
        double score = 0.0;
        std::vector<std::string> matched;
    };

    double min_confidence_;

    static const std::vector<std::pair<TaskIntent, std::vector<std::string>>>& keyword_table();
    std::vector<IntentScore> score_tokens(const std::vector<std::string>& tokens) const;
    ClassificationResult decide(std::vector<IntentScore> scores, size_t token_count) const;
};
