#pragma once

#include "evidence.hpp"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

struct RerankerWeights {
    double diff = 100.0;
    double stack_frame = 80.0;
    double definition = 60.0;
    double reference = 30.0;
    double keyword = 10.0;
    double working_set = 20.0;
    double stack_depth_decay = 0.1;  // per frame, 0..1

    bool operator==(const RerankerWeights& other) const;
    nlohmann::json to_json() const;
};

// Absolute overrides; an unset field keeps the caller's base value.
struct WeightModifiers {
    std::optional<double> diff;
    std::optional<double> stack_frame;
    std::optional<double> definition;
    std::optional<double> reference;
    std::optional<double> keyword;
    std::optional<double> working_set;
    std::optional<double> stack_depth_decay;

    bool empty() const;
    RerankerWeights apply(const RerankerWeights& base) const;

    nlohmann::json to_json() const;
    // Unknown keys throw std::invalid_argument.
    static WeightModifiers from_json(const nlohmann::json& j);
};

struct ScoredEvidence {
    Evidence evidence;
    double score = 0.0;
};

// Composite score for one evidence item:
//   weight = provider weight (diff / definition|reference / keyword)
//   weight = max(weight, stackFrame * (1 - decay)^depth) for the shallowest stack signal
//   weight += workingSet when the file is in the working set
//   score  = baseScore * weight / 100 + kSignalBonus * matched signal count
class Reranker {
public:
    static constexpr double kSignalBonus = 2.0;

    explicit Reranker(RerankerWeights weights, std::vector<std::string> working_set = {});

    double provider_weight(const Evidence& evidence) const;
    double score(const Evidence& evidence) const;

    // Stable: equal scores keep their input order.
    std::vector<ScoredEvidence> rank(std::vector<Evidence> evidence) const;

    const RerankerWeights& weights() const { return weights_; }

private:
    RerankerWeights weights_;
    std::unordered_set<std::string> working_set_;

    bool in_working_set(const std::string& path) const;
};
