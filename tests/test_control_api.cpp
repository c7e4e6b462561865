#include <catch2/catch.hpp>
#include "control_api.hpp"
#include "activity_log.hpp"
#include "admission_gate.hpp"
#include "completion_pipeline.hpp"
#include "event_bus.hpp"
#include "llm_service.hpp"
#include "system_stats.hpp"
#include "fake_provider.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace costgate;

namespace {

struct ApiFixture {
    FakeProvider* groq = nullptr;
    EventBus bus;
    ActivityLog activities;
    SystemStats stats{2};
    std::unique_ptr<LlmService> llm;
    std::unique_ptr<AdmissionGate> gate;
    std::unique_ptr<CompletionPipeline> pipeline;
    std::unique_ptr<ControlApi> api;

    ApiFixture() {
        activities.attach(bus);
        stats.attach(bus);

        std::map<std::string, std::unique_ptr<Provider>> providers;
        auto g = std::make_unique<FakeProvider>("groq");
        groq = g.get();
        providers.emplace("groq", std::move(g));
        providers.emplace("phidata", std::make_unique<FakeProvider>("phidata"));

        llm = std::make_unique<LlmService>(std::move(providers), "groq", &bus);
        gate = std::make_unique<AdmissionGate>(2, &bus);
        pipeline = std::make_unique<CompletionPipeline>(*llm, *gate, CacheSettings{}, &bus);
        api = std::make_unique<ControlApi>(*pipeline, *gate, *llm, activities, stats);
    }

    ApiResponse get(const std::string& path,
                    std::map<std::string, std::string> query = {}) {
        ApiRequest req;
        req.method = "GET";
        req.path = path;
        req.query_params = std::move(query);
        return api->handle(req);
    }

    ApiResponse post(const std::string& path, const std::string& body) {
        ApiRequest req;
        req.method = "POST";
        req.path = path;
        req.body = body;
        return api->handle(req);
    }
};

json body_of(const ApiResponse& resp) {
    return json::parse(resp.body);
}

} // namespace

// ── Routing ─────────────────────────────────────────────────────

TEST_CASE("ControlApi: health", "[api]") {
    ApiFixture f;
    auto resp = f.get("/api/health");
    REQUIRE(resp.status == 200);
    REQUIRE(resp.content_type == "application/json");
    REQUIRE(body_of(resp)["status"] == "ok");
}

TEST_CASE("ControlApi: unknown route is 404", "[api]") {
    ApiFixture f;
    REQUIRE(f.get("/api/nope").status == 404);
}

TEST_CASE("ControlApi: wrong method is 405", "[api]") {
    ApiFixture f;
    REQUIRE(f.post("/api/thread-stats", "{}").status == 405);
    REQUIRE(f.get("/api/llm-cache/clear").status == 405);
}

TEST_CASE("ControlApi: trailing slash is tolerated", "[api]") {
    ApiFixture f;
    REQUIRE(f.get("/api/health/").status == 200);
}

// ── Cache endpoints ─────────────────────────────────────────────

TEST_CASE("ControlApi: cache stats reflect traffic", "[api][cache]") {
    ApiFixture f;
    f.post("/api/llm/complete", R"({"prompt":"hi"})");
    f.post("/api/llm/complete", R"({"prompt":"hi"})");

    auto j = body_of(f.get("/api/llm-cache-stats"));
    REQUIRE(j["size"] == 1);
    REQUIRE(j["hitRate"] == 0.5);
    REQUIRE(j["hits"] == 1);
    REQUIRE(j["misses"] == 1);
}

TEST_CASE("ControlApi: clear empties the cache", "[api][cache]") {
    ApiFixture f;
    f.post("/api/llm/complete", R"({"prompt":"hi"})");

    auto resp = f.post("/api/llm-cache/clear", "");
    REQUIRE(resp.status == 200);
    REQUIRE(body_of(resp)["success"] == true);

    auto j = body_of(f.get("/api/llm-cache-stats"));
    REQUIRE(j["size"] == 0);
    REQUIRE(j["hitRate"] == 0.0);
}

TEST_CASE("ControlApi: settings update applies", "[api][cache]") {
    ApiFixture f;
    auto resp = f.post("/api/llm-cache/settings", R"({"ttlInSeconds":60,"maxSize":2})");
    REQUIRE(resp.status == 200);
    auto j = body_of(resp);
    REQUIRE(j["success"] == true);
    REQUIRE(j["ttlInSeconds"] == 60);
    REQUIRE(j["maxSize"] == 2);

    auto s = f.pipeline->cache().settings();
    REQUIRE(s.ttl.count() == 60);
    REQUIRE(s.max_size == 2);
}

TEST_CASE("ControlApi: invalid settings are 400 and change nothing", "[api][cache]") {
    ApiFixture f;
    for (const char* body : {
             R"({"ttlInSeconds":0,"maxSize":2})",
             R"({"ttlInSeconds":60,"maxSize":0})",
             R"({"ttlInSeconds":-5})",
             R"({"ttlInSeconds":"60"})",
             R"({"ttlInSeconds":1.5})",
             R"({"maxSize":10})",
             R"([1,2])",
             "not json"}) {
        auto resp = f.post("/api/llm-cache/settings", body);
        REQUIRE(resp.status == 400);
        REQUIRE(body_of(resp).contains("error"));
    }
    auto s = f.pipeline->cache().settings();
    REQUIRE(s.ttl.count() == 300);
    REQUIRE(s.max_size == 100);
}

// ── Provider endpoints ──────────────────────────────────────────

TEST_CASE("ControlApi: get and set provider", "[api][provider]") {
    ApiFixture f;
    REQUIRE(body_of(f.get("/api/llm-provider"))["provider"] == "groq");

    auto resp = f.post("/api/llm-provider", R"({"provider":"phidata"})");
    REQUIRE(resp.status == 200);
    REQUIRE(body_of(resp)["provider"] == "phidata");
    REQUIRE(f.llm->default_provider() == "phidata");
    REQUIRE(body_of(f.get("/api/llm-provider"))["provider"] == "phidata");
}

TEST_CASE("ControlApi: unsupported provider is 400", "[api][provider]") {
    ApiFixture f;
    auto resp = f.post("/api/llm-provider", R"({"provider":"openai"})");
    REQUIRE(resp.status == 400);
    REQUIRE(body_of(resp)["error"] == "Unsupported LLM provider: openai");
    REQUIRE(f.llm->default_provider() == "groq");

    REQUIRE(f.post("/api/llm-provider", R"({})").status == 400);
    REQUIRE(f.post("/api/llm-provider", R"({"provider":7})").status == 400);
}

// ── Stats endpoints ─────────────────────────────────────────────

TEST_CASE("ControlApi: thread stats", "[api][stats]") {
    ApiFixture f;
    auto held = f.gate->try_admit("busy");

    auto j = body_of(f.get("/api/thread-stats"));
    REQUIRE(j["activeThreads"] == 1);
    REQUIRE(j["maxThreads"] == 2);
    REQUIRE(j["availableThreads"] == 1);
}

TEST_CASE("ControlApi: system stats count calls and tokens", "[api][stats]") {
    ApiFixture f;
    f.post("/api/llm/complete", R"({"prompt":"a"})");
    f.post("/api/llm/complete", R"({"prompt":"b"})");
    f.post("/api/llm/complete", R"({"prompt":"a"})"); // cached

    auto j = body_of(f.get("/api/stats"));
    REQUIRE(j["apiCalls"] == 2);
    REQUIRE(j["apiTokensUsed"] == 14);
    REQUIRE(j["threadLimit"] == 2);
    REQUIRE(j["activeThreads"] == 0);
}

TEST_CASE("ControlApi: activities honour limit", "[api][stats]") {
    ApiFixture f;
    f.post("/api/llm/complete", R"({"prompt":"a"})");

    auto all = body_of(f.get("/api/activities"));
    REQUIRE(all.is_array());
    REQUIRE(all.size() == 3); // allocated, api call, released

    auto one = body_of(f.get("/api/activities", {{"limit", "1"}}));
    REQUIRE(one.size() == 1);
    REQUIRE(one[0]["description"] == "Thread released for: LLM completion via groq");

    REQUIRE(f.get("/api/activities", {{"limit", "zero"}}).status == 400);
}

// ── Completion endpoint ─────────────────────────────────────────

TEST_CASE("ControlApi: complete returns text, usage and cached flag", "[api][complete]") {
    ApiFixture f;
    auto first = f.post("/api/llm/complete", R"({"prompt":"hi","temperature":0.2})");
    REQUIRE(first.status == 200);
    auto j = body_of(first);
    REQUIRE(j["text"] == "groq:hi");
    REQUIRE(j["usage"]["inputTokens"] == 3);
    REQUIRE(j["usage"]["outputTokens"] == 4);
    REQUIRE(j["usage"]["totalTokens"] == 7);
    REQUIRE(j["cached"] == false);

    auto second = body_of(f.post("/api/llm/complete", R"({"prompt":"hi","temperature":0.2})"));
    REQUIRE(second["cached"] == true);
    REQUIRE(second["text"] == "groq:hi");
}

TEST_CASE("ControlApi: skipCache forces an upstream call", "[api][complete]") {
    ApiFixture f;
    f.post("/api/llm/complete", R"({"prompt":"hi"})");
    auto j = body_of(f.post("/api/llm/complete", R"({"prompt":"hi","skipCache":true})"));
    REQUIRE(j["cached"] == false);
    REQUIRE(f.groq->calls.load() == 2);
}

TEST_CASE("ControlApi: invalid completion bodies are 400", "[api][complete]") {
    ApiFixture f;
    for (const char* body : {
             R"({})",
             R"({"prompt":""})",
             R"({"prompt":42})",
             R"({"prompt":"x","temperature":"hot"})",
             R"({"prompt":"x","temperature":3})",
             R"({"prompt":"x","maxTokens":0})",
             R"({"prompt":"x","topP":0})",
             R"({"prompt":"x","stopSequences":"END"})",
             R"({"prompt":"x","stopSequences":[1]})",
             R"({"prompt":"x","skipCache":"yes"})",
             R"({"prompt":"x","provider":"openai"})"}) {
        REQUIRE(f.post("/api/llm/complete", body).status == 400);
    }
    REQUIRE(f.groq->calls.load() == 0);
}

TEST_CASE("ControlApi: upstream failure is 502", "[api][complete]") {
    ApiFixture f;
    f.groq->fail = true;
    auto resp = f.post("/api/llm/complete", R"({"prompt":"hi"})");
    REQUIRE(resp.status == 502);
    REQUIRE(body_of(resp)["error"] == "groq is down");
}

TEST_CASE("error_response: invalid UTF-8 in an upstream message still serializes", "[api][complete]") {
    auto resp = error_response(502, std::string("groq API error (HTTP 500): bad \xff\xfe body"));
    REQUIRE(resp.status == 502);
    auto body = body_of(resp);
    REQUIRE(body["error"].get<std::string>().find("bad ") != std::string::npos);
    REQUIRE(body["error"].get<std::string>().find("\xef\xbf\xbd") != std::string::npos);
}

TEST_CASE("ControlApi: full gate is 429", "[api][complete]") {
    ApiFixture f;
    auto a = f.gate->try_admit("one");
    auto b = f.gate->try_admit("two");

    auto resp = f.post("/api/llm/complete", R"({"prompt":"hi"})");
    REQUIRE(resp.status == 429);
    REQUIRE(body_of(resp)["error"] == "Thread limit reached (2/2). Try again later.");
}

// ── parse_completion_request ────────────────────────────────────

TEST_CASE("parse_completion_request: maps every field", "[api][complete]") {
    auto req = parse_completion_request(json::parse(R"({
        "prompt": "Summarize",
        "system": "Be brief",
        "provider": "phidata",
        "temperature": 0.3,
        "maxTokens": 200,
        "topP": 0.95,
        "stopSequences": ["END"],
        "skipCache": true,
        "description": "digest"
    })"));
    REQUIRE(req.prompt == "Summarize");
    REQUIRE(req.system.value_or("") == "Be brief");
    REQUIRE(req.provider.value_or("") == "phidata");
    REQUIRE(req.temperature.value_or(0) == 0.3);
    REQUIRE(req.max_tokens.value_or(0) == 200);
    REQUIRE(req.top_p.value_or(0) == 0.95);
    REQUIRE(req.stop_sequences == std::vector<std::string>{"END"});
    REQUIRE(req.skip_cache);
    REQUIRE(req.description == "digest");
}

TEST_CASE("parse_completion_request: optional fields stay unset", "[api][complete]") {
    auto req = parse_completion_request(json::parse(R"({"prompt":"hi","system":null})"));
    REQUIRE_FALSE(req.system.has_value());
    REQUIRE_FALSE(req.provider.has_value());
    REQUIRE_FALSE(req.temperature.has_value());
    REQUIRE_FALSE(req.max_tokens.has_value());
    REQUIRE_FALSE(req.skip_cache);
}
