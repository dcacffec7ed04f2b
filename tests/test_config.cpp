#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include <stdexcept>
#include <stdlib.h>

TEST_CASE("Configuration from environment", "[config]") {
    unsetenv("CTXRANK_WORKSPACE");
    unsetenv("CTXRANK_TOKEN_BUDGET");
    unsetenv("CTXRANK_MIN_CONFIDENCE");
    unsetenv("CTXRANK_MAX_PARALLEL");

    SECTION("Defaults") {
        auto cfg = Config::from_env();
        REQUIRE(cfg.workspace == ".");
        REQUIRE(cfg.token_budget == 8000);
        REQUIRE(cfg.provider_timeout_ms == 5000);
        REQUIRE(cfg.deadline_ms == 15000);
        REQUIRE(cfg.max_parallel == 3);
        REQUIRE(cfg.max_results == 50);
        REQUIRE(cfg.min_confidence == 0.15);
        REQUIRE(cfg.rg_path == "rg");
        REQUIRE_NOTHROW(cfg.validate());
    }

    SECTION("Overrides and invalid numbers") {
        setenv("CTXRANK_TOKEN_BUDGET", "1200", 1);
        setenv("CTXRANK_MIN_CONFIDENCE", "not-a-number", 1);
        auto cfg = Config::from_env();
        REQUIRE(cfg.token_budget == 1200);
        REQUIRE(cfg.min_confidence == 0.15);
        unsetenv("CTXRANK_TOKEN_BUDGET");
        unsetenv("CTXRANK_MIN_CONFIDENCE");
    }

    SECTION("Validation rejects nonsense") {
        setenv("CTXRANK_MAX_PARALLEL", "0", 1);
        auto cfg = Config::from_env();
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
        unsetenv("CTXRANK_MAX_PARALLEL");

        cfg = Config::from_env();
        cfg.min_confidence = 1.5;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }
}
