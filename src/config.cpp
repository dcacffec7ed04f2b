#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.workspace = get_env("CTXRANK_WORKSPACE", ".");
    cfg.snapshot_hash = get_env("CTXRANK_SNAPSHOT");

    cfg.token_budget = get_env_int("CTXRANK_TOKEN_BUDGET", 8000);
    cfg.provider_timeout_ms = get_env_int("CTXRANK_PROVIDER_TIMEOUT_MS", 5000);
    cfg.deadline_ms = get_env_int("CTXRANK_DEADLINE_MS", 15000);
    cfg.max_parallel = get_env_int("CTXRANK_MAX_PARALLEL", 3);
    cfg.max_results = get_env_int("CTXRANK_MAX_RESULTS", 50);

    cfg.min_confidence = get_env_double("CTXRANK_MIN_CONFIDENCE", 0.15);
    cfg.strategy_file = get_env("CTXRANK_STRATEGY_FILE");

    cfg.rg_path = get_env("CTXRANK_RG", "rg");

    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (workspace.empty()) {
        throw std::runtime_error("CTXRANK_WORKSPACE must not be empty");
    }
    if (token_budget < 0) {
        throw std::runtime_error("CTXRANK_TOKEN_BUDGET must be >= 0");
    }
    if (provider_timeout_ms <= 0 || deadline_ms <= 0) {
        throw std::runtime_error("CTXRANK_PROVIDER_TIMEOUT_MS and CTXRANK_DEADLINE_MS must be > 0");
    }
    if (max_parallel < 1) {
        throw std::runtime_error("CTXRANK_MAX_PARALLEL must be >= 1");
    }
    if (max_results < 1) {
        throw std::runtime_error("CTXRANK_MAX_RESULTS must be >= 1");
    }
    if (min_confidence < 0.0 || min_confidence > 1.0) {
        throw std::runtime_error("CTXRANK_MIN_CONFIDENCE must be within [0, 1]");
    }

    spdlog::debug("Configuration validated successfully");
    spdlog::debug("  Workspace: {}", workspace);
    spdlog::debug("  Budget: {} tokens, timeouts: provider={}ms, cycle={}ms",
                  token_budget, provider_timeout_ms, deadline_ms);
}
