#include <catch2/catch.hpp>
#include "llm_service.hpp"
#include "event_bus.hpp"
#include "mock_http_client.hpp"
#include "fake_provider.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace costgate;

namespace {

struct ServiceFixture {
    FakeProvider* groq = nullptr;
    FakeProvider* phidata = nullptr;
    EventBus bus;
    std::unique_ptr<LlmService> service;

    explicit ServiceFixture(const std::string& default_provider = "groq") {
        std::map<std::string, std::unique_ptr<Provider>> providers;
        auto g = std::make_unique<FakeProvider>("groq");
        auto p = std::make_unique<FakeProvider>("phidata");
        groq = g.get();
        phidata = p.get();
        providers.emplace("groq", std::move(g));
        providers.emplace("phidata", std::move(p));
        service = std::make_unique<LlmService>(std::move(providers), default_provider, &bus);
    }
};

CompletionRequest request(const std::string& prompt) {
    CompletionRequest req;
    req.prompt = prompt;
    return req;
}

} // namespace

// ── Routing ─────────────────────────────────────────────────────

TEST_CASE("LlmService: uses the default provider", "[llm]") {
    ServiceFixture f;
    auto result = f.service->complete(request("hi"));
    REQUIRE(result.text == "groq:hi");
    REQUIRE(f.groq->calls.load() == 1);
    REQUIRE(f.phidata->calls.load() == 0);
}

TEST_CASE("LlmService: request provider overrides the default", "[llm]") {
    ServiceFixture f;
    auto req = request("hi");
    req.provider = "phidata";
    REQUIRE(f.service->complete(req).text == "phidata:hi");
    REQUIRE(f.service->resolve_provider(req) == "phidata");
    REQUIRE(f.service->resolve_provider(request("x")) == "groq");
}

TEST_CASE("LlmService: unknown request provider throws", "[llm]") {
    ServiceFixture f;
    auto req = request("hi");
    req.provider = "openai";
    REQUIRE_THROWS_AS(f.service->complete(req), std::invalid_argument);
}

TEST_CASE("LlmService: unknown default falls back to the first provider", "[llm]") {
    ServiceFixture f("nonexistent");
    REQUIRE(f.service->default_provider() == "groq");
}

TEST_CASE("LlmService: empty provider set is rejected", "[llm]") {
    std::map<std::string, std::unique_ptr<Provider>> none;
    REQUIRE_THROWS_AS(LlmService(std::move(none), "groq"), std::invalid_argument);
}

TEST_CASE("LlmService: provider_names lists every provider", "[llm]") {
    ServiceFixture f;
    auto names = f.service->provider_names();
    REQUIRE(names == std::vector<std::string>{"groq", "phidata"});
    REQUIRE(f.service->has_provider("phidata"));
    REQUIRE_FALSE(f.service->has_provider("openai"));
}

// ── Default provider switching ──────────────────────────────────

TEST_CASE("LlmService: set_default_provider switches and publishes", "[llm]") {
    ServiceFixture f;
    std::string previous;
    std::string current;
    subscribe<ProviderChangedEvent>(f.bus, [&](const ProviderChangedEvent& ev) {
        previous = ev.previous;
        current = ev.provider;
    });

    f.service->set_default_provider("phidata");
    REQUIRE(f.service->default_provider() == "phidata");
    REQUIRE(previous == "groq");
    REQUIRE(current == "phidata");
    REQUIRE(f.service->complete(request("x")).text == "phidata:x");
}

TEST_CASE("LlmService: unsupported default provider leaves state unchanged", "[llm]") {
    ServiceFixture f;
    int events = 0;
    subscribe<ProviderChangedEvent>(f.bus, [&](const ProviderChangedEvent&) { events++; });

    try {
        f.service->set_default_provider("openai");
        FAIL("expected invalid_argument");
    } catch (const std::invalid_argument& e) {
        REQUIRE(std::string(e.what()) == "Unsupported LLM provider: openai");
    }
    REQUIRE(f.service->default_provider() == "groq");
    REQUIRE(events == 0);
}

// ── Events ──────────────────────────────────────────────────────

TEST_CASE("LlmService: success publishes usage", "[llm][events]") {
    ServiceFixture f;
    std::string provider;
    std::string description;
    uint64_t tokens = 0;
    subscribe<ProviderResponseEvent>(f.bus, [&](const ProviderResponseEvent& ev) {
        provider = ev.provider;
        description = ev.description;
        tokens = ev.usage.total_tokens;
    });

    auto req = request("hi");
    req.description = "weekly digest";
    f.service->complete(req);
    REQUIRE(provider == "groq");
    REQUIRE(description == "weekly digest");
    REQUIRE(tokens == 7);
}

TEST_CASE("LlmService: failure publishes and rethrows", "[llm][events]") {
    ServiceFixture f;
    f.groq->fail = true;
    std::string error;
    subscribe<ProviderErrorEvent>(f.bus, [&](const ProviderErrorEvent& ev) {
        error = ev.error;
    });

    REQUIRE_THROWS_WITH(f.service->complete(request("hi")), "groq is down");
    REQUIRE(error == "groq is down");
}

// ── Built from config ───────────────────────────────────────────

TEST_CASE("LlmService: builds registered providers from config", "[llm]") {
    MockHttpClient http;
    http.next_response = {200, chat_reply("from groq")};

    Config cfg;
    cfg.provider = "groq";
    cfg.providers["groq"].api_key = "gk";

    LlmService service(cfg, http);
    REQUIRE(service.has_provider("groq"));
    REQUIRE(service.has_provider("phidata"));

    auto result = service.complete(request("hello"));
    REQUIRE(result.text == "from groq");
    REQUIRE(http.last_url == "https://api.groq.com/openai/v1/chat/completions");

    // Registered without a key: fails only when used
    auto req = request("hello");
    req.provider = "phidata";
    REQUIRE_THROWS_AS(service.complete(req), std::runtime_error);
}
