#include "health.hpp"
#include "util.hpp"

ProviderHealth::ProviderHealth(std::vector<std::shared_ptr<EvidenceProvider>> providers)
    : providers_(std::move(providers)) {}

nlohmann::json ProviderHealth::get_status() {
    bool any_ok = false;
    nlohmann::json providers = nlohmann::json::object();

    for (const auto& provider : providers_) {
        bool available = provider->is_available();
        any_ok = any_ok || available;
        providers[provider->name()] = {
            {"type", to_string(provider->type())},
            {"available", available}
        };
    }

    return {
        {"ok", any_ok},
        {"providers", providers},
        {"ts", util::current_iso8601()}
    };
}
