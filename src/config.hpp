#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Workspace
    std::string workspace;
    std::string snapshot_hash;

    // Retrieval
    int token_budget;
    int provider_timeout_ms;
    int deadline_ms;
    int max_parallel;
    int max_results;

    // Classification
    double min_confidence;
    std::string strategy_file;

    // Search backend
    std::string rg_path;

    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
