#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/lsp_provider.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

class FakeHub : public LspHub {
public:
    bool initialized = true;
    bool throw_on_definition = false;
    std::vector<LspLocation> definitions;
    std::vector<LspLocation> refs;
    std::vector<std::chrono::milliseconds> timeouts;
    std::vector<bool> include_declaration;

    bool is_initialized() const override { return initialized; }

    std::vector<LspLocation> definition(const std::string&, int, int,
                                        std::chrono::milliseconds timeout) override {
        timeouts.push_back(timeout);
        if (throw_on_definition) throw std::runtime_error("server crashed");
        return definitions;
    }

    std::vector<LspLocation> references(const std::string&, int, int, bool include_decl,
                                        std::chrono::milliseconds timeout) override {
        timeouts.push_back(timeout);
        include_declaration.push_back(include_decl);
        return refs;
    }
};

LspLocation location(const std::string& uri, int line) {
    LspLocation loc;
    loc.uri = uri;
    loc.start = {line, 0};
    loc.end = {line, 10};
    return loc;
}

Signal positioned(const std::string& symbol, const std::string& path, int line) {
    Signal s;
    s.type = SignalType::Symbol;
    s.value = symbol;
    s.confidence = 0.5;
    s.metadata = {{"path", path}, {"line", line}, {"character", 4}};
    return s;
}

} // namespace

TEST_CASE("LSP provider availability", "[lsp]") {
    LspProvider provider(LspProviderConfig{});
    REQUIRE(provider.type() == ProviderType::Lsp);
    REQUIRE(provider.name() == "LSP Analysis");
    REQUIRE(provider.base_weight() == 60.0);

    REQUIRE_FALSE(provider.is_available());
    REQUIRE(provider.query({positioned("run", "src/a.ts", 3)}, {}).empty());

    auto hub = std::make_shared<FakeHub>();
    hub->initialized = false;
    provider.set_hub(hub);
    REQUIRE_FALSE(provider.is_available());

    hub->initialized = true;
    REQUIRE(provider.is_available());
}

TEST_CASE("LSP provider query", "[lsp]") {
    auto hub = std::make_shared<FakeHub>();
    LspProviderConfig cfg;
    cfg.workspace_root = "/nonexistent-ctxrank-root";
    LspProvider provider(cfg, hub);

    SECTION("Signals without a position are ignored") {
        Signal bare;
        bare.type = SignalType::Symbol;
        bare.value = "run";
        hub->definitions = {location("file:///src/a.ts", 3)};
        REQUIRE(provider.query({bare}, {}).empty());
        REQUIRE(hub->timeouts.empty());
    }

    SECTION("Definitions and references with placeholder content") {
        hub->definitions = {location("file:///nowhere/def.ts", 20)};
        hub->refs = {location("file:///nowhere/use.ts", 2)};

        auto out = provider.query({positioned("run", "src/a.ts", 3)}, {});
        REQUIRE(out.size() == 2);

        REQUIRE(out[0].path == "/nowhere/def.ts");
        REQUIRE(out[0].range == std::make_pair(16, 26));
        REQUIRE(out[0].content == "[LSP definition: run]");
        REQUIRE(out[0].base_score == Catch::Approx(30.0));
        REQUIRE(out[0].metadata.symbol_kind == SymbolKind::Definition);

        REQUIRE(out[1].range == std::make_pair(1, 8));
        REQUIRE(out[1].content == "[LSP reference: run]");
        REQUIRE(out[1].base_score == Catch::Approx(15.0));
        REQUIRE(out[1].metadata.symbol_kind == SymbolKind::Reference);

        REQUIRE(hub->timeouts == std::vector<std::chrono::milliseconds>{
            std::chrono::milliseconds(5000), std::chrono::milliseconds(10000)});
        REQUIRE(hub->include_declaration == std::vector<bool>{false});
    }

    SECTION("Duplicate locations collapse") {
        hub->definitions = {location("file:///x.ts", 10)};
        hub->refs = {location("file:///x.ts", 10), location("file:///x.ts", 10)};
        auto out = provider.query({positioned("run", "src/a.ts", 3)}, {});
        REQUIRE(out.size() == 1);
        REQUIRE(out[0].metadata.symbol_kind == SymbolKind::Definition);
    }

    SECTION("Hub errors degrade to no evidence for that signal") {
        hub->throw_on_definition = true;
        hub->definitions = {location("file:///x.ts", 10)};
        REQUIRE(provider.query({positioned("run", "src/a.ts", 3)}, {}).empty());
    }

    SECTION("Context lines and max results") {
        hub->definitions = {location("file:///x.ts", 10), location("file:///y.ts", 30)};
        ProviderQueryOptions options;
        options.context_lines = 0;
        options.max_results = 1;
        auto out = provider.query({positioned("run", "src/a.ts", 3)}, options);
        REQUIRE(out.size() == 1);
        REQUIRE(out[0].range == std::make_pair(11, 11));
    }
}

TEST_CASE("LSP provider reads workspace files", "[lsp]") {
    auto root = std::filesystem::temp_directory_path() / "ctxrank-lsp-ws";
    std::filesystem::create_directories(root / "src");
    {
        std::ofstream out(root / "src" / "lib.ts");
        out << "l1\nl2\nl3\nl4\nl5\n";
    }

    auto hub = std::make_shared<FakeHub>();
    LspProviderConfig cfg;
    cfg.workspace_root = root.string();
    LspProvider provider(cfg, hub);

    hub->definitions = {location("src/lib.ts", 2)};
    ProviderQueryOptions options;
    options.context_lines = 1;
    auto out = provider.query({positioned("run", "src/a.ts", 0)}, options);
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].content == "l2\nl3\nl4");

    std::filesystem::remove_all(root);
}

TEST_CASE("File URIs become paths", "[lsp]") {
    REQUIRE(LspProvider::uri_to_path("file:///home/u/a%20b.ts") == "/home/u/a b.ts");
    REQUIRE(LspProvider::uri_to_path("file://host/share/x.ts") == "/share/x.ts");
    REQUIRE(LspProvider::uri_to_path("src/plain.ts") == "src/plain.ts");
}
