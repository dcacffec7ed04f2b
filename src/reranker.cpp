#include "reranker.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

bool RerankerWeights::operator==(const RerankerWeights& other) const {
    return diff == other.diff && stack_frame == other.stack_frame &&
           definition == other.definition && reference == other.reference &&
           keyword == other.keyword && working_set == other.working_set &&
           stack_depth_decay == other.stack_depth_decay;
}

nlohmann::json RerankerWeights::to_json() const {
    return {
        {"diff", diff},
        {"stack_frame", stack_frame},
        {"definition", definition},
        {"reference", reference},
        {"keyword", keyword},
        {"working_set", working_set},
        {"stack_depth_decay", stack_depth_decay}
    };
}

bool WeightModifiers::empty() const {
    return !diff && !stack_frame && !definition && !reference &&
           !keyword && !working_set && !stack_depth_decay;
}

RerankerWeights WeightModifiers::apply(const RerankerWeights& base) const {
    RerankerWeights w = base;
    if (diff) w.diff = *diff;
    if (stack_frame) w.stack_frame = *stack_frame;
    if (definition) w.definition = *definition;
    if (reference) w.reference = *reference;
    if (keyword) w.keyword = *keyword;
    if (working_set) w.working_set = *working_set;
    if (stack_depth_decay) w.stack_depth_decay = *stack_depth_decay;
    return w;
}

nlohmann::json WeightModifiers::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    if (diff) j["diff"] = *diff;
    if (stack_frame) j["stack_frame"] = *stack_frame;
    if (definition) j["definition"] = *definition;
    if (reference) j["reference"] = *reference;
    if (keyword) j["keyword"] = *keyword;
    if (working_set) j["working_set"] = *working_set;
    if (stack_depth_decay) j["stack_depth_decay"] = *stack_depth_decay;
    return j;
}

WeightModifiers WeightModifiers::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("weight_modifiers must be an object");
    }
    WeightModifiers m;
    for (const auto& [key, value] : j.items()) {
        if (!value.is_number()) {
            throw std::invalid_argument("weight modifier '" + key + "' must be a number");
        }
        double v = value.get<double>();
        if (key == "diff") m.diff = v;
        else if (key == "stack_frame" || key == "stackFrame") m.stack_frame = v;
        else if (key == "definition") m.definition = v;
        else if (key == "reference") m.reference = v;
        else if (key == "keyword") m.keyword = v;
        else if (key == "working_set" || key == "workingSet") m.working_set = v;
        else if (key == "stack_depth_decay" || key == "stackDepthDecay") m.stack_depth_decay = v;
        else throw std::invalid_argument("unknown weight modifier: " + key);
    }
    return m;
}

Reranker::Reranker(RerankerWeights weights, std::vector<std::string> working_set)
    : weights_(weights) {
    for (const auto& path : working_set) {
        working_set_.insert(util::normalize_path(path));
    }
}

bool Reranker::in_working_set(const std::string& path) const {
    if (working_set_.empty()) return false;
    std::string p = util::normalize_path(path);
    if (working_set_.count(p)) return true;
    for (const auto& w : working_set_) {
        if (util::ends_with(p, "/" + w) || util::ends_with(w, "/" + p)) return true;
    }
    return false;
}

double Reranker::provider_weight(const Evidence& evidence) const {
    switch (evidence.provider) {
        case ProviderType::Diff:
            return weights_.diff;
        case ProviderType::Lsp:
            if (evidence.metadata.symbol_kind == SymbolKind::Reference) return weights_.reference;
            return weights_.definition;
        case ProviderType::Search:
            return weights_.keyword;
    }
    return weights_.keyword;
}

double Reranker::score(const Evidence& evidence) const {
    double weight = provider_weight(evidence);

    std::optional<int> depth;
    for (const auto& signal : evidence.matched_signals) {
        auto d = signal.stack_depth();
        if (d && (!depth || *d < *depth)) depth = d;
    }
    if (depth) {
        double decay = std::clamp(weights_.stack_depth_decay, 0.0, 1.0);
        weight = std::max(weight, weights_.stack_frame * std::pow(1.0 - decay, *depth));
    }

    if (in_working_set(evidence.path)) {
        weight += weights_.working_set;
    }

    double base = std::max(0.0, evidence.base_score);
    return base * weight / 100.0 + kSignalBonus * static_cast<double>(evidence.matched_signals.size());
}

std::vector<ScoredEvidence> Reranker::rank(std::vector<Evidence> evidence) const {
    std::vector<ScoredEvidence> scored;
    scored.reserve(evidence.size());
    for (auto& ev : evidence) {
        double s = score(ev);
        scored.push_back({std::move(ev), s});
    }
    std::stable_sort(scored.begin(), scored.end(), [](const ScoredEvidence& a, const ScoredEvidence& b) {
        return a.score > b.score;
    });
    return scored;
}
