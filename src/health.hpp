#pragma once
#include "evidence.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <vector>

class ProviderHealth {
public:
    explicit ProviderHealth(std::vector<std::shared_ptr<EvidenceProvider>> providers);
    nlohmann::json get_status();

private:
    std::vector<std::shared_ptr<EvidenceProvider>> providers_;
};
