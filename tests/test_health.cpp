#include <catch2/catch_test_macros.hpp>
#include "../src/health.hpp"

namespace {

class StaticProvider : public EvidenceProvider {
public:
    StaticProvider(ProviderType type, std::string name, bool available)
        : type_(type), name_(std::move(name)), available_(available) {}

    ProviderType type() const override { return type_; }
    std::string name() const override { return name_; }
    double base_weight() const override { return 1.0; }
    bool is_available() override { return available_; }
    std::vector<Evidence> query(const std::vector<Signal>&, const ProviderQueryOptions&) override { return {}; }

private:
    ProviderType type_;
    std::string name_;
    bool available_;
};

} // namespace

TEST_CASE("Provider health report", "[health]") {
    SECTION("Ok while any provider is available") {
        ProviderHealth health({
            std::make_shared<StaticProvider>(ProviderType::Diff, "Git Diff", false),
            std::make_shared<StaticProvider>(ProviderType::Search, "Code Search", true)
        });
        auto status = health.get_status();
        REQUIRE(status["ok"] == true);
        REQUIRE(status["providers"]["Git Diff"]["available"] == false);
        REQUIRE(status["providers"]["Git Diff"]["type"] == "diff");
        REQUIRE(status["providers"]["Code Search"]["available"] == true);
        REQUIRE(status.contains("ts"));
    }

    SECTION("Not ok when nothing is available") {
        ProviderHealth health({std::make_shared<StaticProvider>(ProviderType::Lsp, "LSP Analysis", false)});
        REQUIRE(health.get_status()["ok"] == false);
    }
}
