#include "config.hpp"
#include "diff_provider.hpp"
#include "git_snapshot_service.hpp"
#include "health.hpp"
#include "intent_classifier.hpp"
#include "intent_strategy.hpp"
#include "lsp_provider.hpp"
#include "orchestrator.hpp"
#include "ripgrep_backend.hpp"
#include "search_provider.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

CancellationToken g_cancel;

void signal_handler(int) {
    g_cancel.cancel();
}

void usage(const char* argv0) {
    std::fprintf(stderr,
                 "Usage: %s [--error] [--test-file] [--recent <path>]... [--budget N] <task text>\n"
                 "       %s --classify <task text>\n"
                 "       %s --track\n"
                 "       %s --health\n",
                 argv0, argv0, argv0, argv0);
}

enum class Mode { Retrieve, Classify, Track, Health };

struct CliArgs {
    Mode mode = Mode::Retrieve;
    ClassificationContext context;
    std::optional<size_t> budget;
    std::string task;
};

// Returns false on a usage error.
bool parse_args(int argc, char** argv, CliArgs& args) {
    std::vector<std::string> words;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--error") == 0) {
            args.context.error_present = true;
        } else if (std::strcmp(argv[i], "--test-file") == 0) {
            args.context.test_file = true;
        } else if (std::strcmp(argv[i], "--recent") == 0) {
            if (++i >= argc) return false;
            args.context.recent_files.push_back(argv[i]);
        } else if (std::strcmp(argv[i], "--budget") == 0) {
            if (++i >= argc) return false;
            try {
                long long n = std::stoll(argv[i]);
                if (n < 0) return false;
                args.budget = static_cast<size_t>(n);
            } catch (const std::exception&) {
                return false;
            }
        } else if (std::strcmp(argv[i], "--classify") == 0) {
            args.mode = Mode::Classify;
        } else if (std::strcmp(argv[i], "--track") == 0) {
            args.mode = Mode::Track;
        } else if (std::strcmp(argv[i], "--health") == 0) {
            args.mode = Mode::Health;
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            std::fprintf(stderr, "Unknown arg: %s\n", argv[i]);
            return false;
        } else {
            words.push_back(argv[i]);
        }
    }
    for (const auto& w : words) {
        if (!args.task.empty()) args.task += " ";
        args.task += w;
    }
    if ((args.mode == Mode::Retrieve || args.mode == Mode::Classify) && args.task.empty()) {
        return false;
    }
    return true;
}

} // namespace

void setup_logging(const std::string& log_level) {
    // stdout carries the JSON result
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("ctxrank", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::debug("Logging initialized at level: {}", log_level);
}

int main(int argc, char** argv) {
    CliArgs args;
    if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0)) {
        usage(argv[0]);
        return 0;
    }
    if (!parse_args(argc, argv, args)) {
        usage(argv[0]);
        return 2;
    }

    Config config;
    try {
        config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();
    } catch (const std::exception& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        IntentClassifier classifier(config.min_confidence);
        if (args.mode == Mode::Classify) {
            std::cout << classifier.classify_with_context(args.task, args.context).to_json()
                             .dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
            return 0;
        }

        auto git = std::make_shared<GitSnapshotService>(config.workspace);
        if (args.mode == Mode::Track) {
            auto hash = git->track();
            if (!hash) {
                spdlog::error("Failed to snapshot workspace {}", config.workspace);
                return 1;
            }
            std::cout << *hash << std::endl;
            return 0;
        }

        std::optional<std::string> snapshot;
        if (!config.snapshot_hash.empty()) snapshot = config.snapshot_hash;

        SearchProviderConfig search_cfg;
        search_cfg.workspace_root = config.workspace;
        LspProviderConfig lsp_cfg;
        lsp_cfg.workspace_root = config.workspace;

        // No language-server hub is attached from the command line.
        std::vector<std::shared_ptr<EvidenceProvider>> providers = {
            std::make_shared<DiffProvider>(git, snapshot),
            std::make_shared<LspProvider>(lsp_cfg),
            std::make_shared<SearchProvider>(search_cfg,
                std::make_shared<RipgrepBackend>(config.rg_path))
        };

        if (args.mode == Mode::Health) {
            ProviderHealth health(providers);
            std::cout << health.get_status().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
            return 0;
        }

        CustomStrategies custom;
        if (!config.strategy_file.empty()) {
            custom = IntentStrategyProvider::load_custom_strategies_file(config.strategy_file);
        }

        OrchestratorConfig orch_cfg;
        orch_cfg.total_budget = static_cast<size_t>(config.token_budget);
        orch_cfg.provider_timeout = std::chrono::milliseconds(config.provider_timeout_ms);
        orch_cfg.deadline = std::chrono::milliseconds(config.deadline_ms);
        orch_cfg.max_parallel = static_cast<size_t>(config.max_parallel);
        orch_cfg.max_results = static_cast<size_t>(config.max_results);

        EvidenceOrchestrator orchestrator(providers,
                                          std::make_shared<IntentStrategyProvider>(custom),
                                          classifier, orch_cfg);

        RetrievalRequest request;
        request.task = args.task;
        request.context = args.context;
        request.token_budget = args.budget;
        request.cancel = g_cancel;

        auto result = orchestrator.collect(request);
        std::cout << result.dump(2) << std::endl;
    } catch (const std::exception& e) {
        spdlog::error("ctxrank failed: {}", e.what());
        return 1;
    }

    return 0;
}
