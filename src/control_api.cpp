#include "control_api.hpp"
#include "activity_log.hpp"
#include "admission_gate.hpp"
#include "completion_pipeline.hpp"
#include "llm_service.hpp"
#include "system_stats.hpp"
#include "util.hpp"
#include <iostream>
#include <stdexcept>

namespace costgate {

static constexpr size_t kDefaultActivityLimit = 20;

// ── Helpers ─────────────────────────────────────────────────────

ApiResponse json_response(int status, const nlohmann::json& body) {
    ApiResponse resp;
    resp.status = status;
    resp.content_type = "application/json";
    resp.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return resp;
}

ApiResponse error_response(int status, const std::string& message) {
    return json_response(status, {{"error", message}});
}

static nlohmann::json parse_body(const ApiRequest& req) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.body.empty() ? "{}" : req.body);
    } catch (const nlohmann::json::parse_error&) {
        throw std::invalid_argument("Request body is not valid JSON");
    }
    if (!body.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }
    return body;
}

// Integer >= 1 that fits in 32 bits.
static uint32_t require_positive_int(const nlohmann::json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end()) {
        throw std::invalid_argument(std::string(field) + " is required");
    }
    if (!it->is_number_unsigned() || it->get<uint64_t>() < 1 ||
        it->get<uint64_t>() > UINT32_MAX) {
        throw std::invalid_argument(std::string(field) + " must be a positive integer");
    }
    return static_cast<uint32_t>(it->get<uint64_t>());
}

static std::optional<std::string> optional_string(const nlohmann::json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw std::invalid_argument(std::string(field) + " must be a string");
    }
    return it->get<std::string>();
}

static std::optional<double> optional_number(const nlohmann::json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || it->is_null()) return std::nullopt;
    if (!it->is_number()) {
        throw std::invalid_argument(std::string(field) + " must be a number");
    }
    return it->get<double>();
}

CompletionRequest parse_completion_request(const nlohmann::json& body) {
    CompletionRequest req;

    auto prompt = optional_string(body, "prompt");
    if (!prompt || trim(*prompt).empty()) {
        throw std::invalid_argument("prompt is required");
    }
    req.prompt = *prompt;
    req.system = optional_string(body, "system");
    req.provider = optional_string(body, "provider");
    req.temperature = optional_number(body, "temperature");
    req.top_p = optional_number(body, "topP");
    if (body.contains("maxTokens") && !body["maxTokens"].is_null()) {
        req.max_tokens = require_positive_int(body, "maxTokens");
    }

    if (req.temperature && (*req.temperature < 0.0 || *req.temperature > 2.0)) {
        throw std::invalid_argument("temperature must be between 0 and 2");
    }
    if (req.top_p && (*req.top_p <= 0.0 || *req.top_p > 1.0)) {
        throw std::invalid_argument("topP must be in (0, 1]");
    }

    auto stop = body.find("stopSequences");
    if (stop != body.end() && !stop->is_null()) {
        if (!stop->is_array()) {
            throw std::invalid_argument("stopSequences must be an array of strings");
        }
        for (const auto& s : *stop) {
            if (!s.is_string()) {
                throw std::invalid_argument("stopSequences must be an array of strings");
            }
            req.stop_sequences.push_back(s.get<std::string>());
        }
    }

    auto skip = body.find("skipCache");
    if (skip != body.end() && !skip->is_null()) {
        if (!skip->is_boolean()) {
            throw std::invalid_argument("skipCache must be a boolean");
        }
        req.skip_cache = skip->get<bool>();
    }

    req.description = optional_string(body, "description").value_or("");
    return req;
}

// ── ControlApi ──────────────────────────────────────────────────

ControlApi::ControlApi(CompletionPipeline& pipeline, AdmissionGate& gate, LlmService& llm,
                       ActivityLog& activities, SystemStats& stats)
    : pipeline_(pipeline), gate_(gate), llm_(llm), activities_(activities), stats_(stats) {
    add_route("GET", "/api/health", [this](const ApiRequest& r) { return health(r); });
    add_route("GET", "/api/llm-cache-stats", [this](const ApiRequest& r) { return cache_stats(r); });
    add_route("POST", "/api/llm-cache/clear", [this](const ApiRequest& r) { return cache_clear(r); });
    add_route("POST", "/api/llm-cache/settings", [this](const ApiRequest& r) { return cache_settings(r); });
    add_route("GET", "/api/llm-provider", [this](const ApiRequest& r) { return get_provider(r); });
    add_route("POST", "/api/llm-provider", [this](const ApiRequest& r) { return set_provider(r); });
    add_route("GET", "/api/thread-stats", [this](const ApiRequest& r) { return thread_stats(r); });
    add_route("GET", "/api/stats", [this](const ApiRequest& r) { return system_stats(r); });
    add_route("GET", "/api/activities", [this](const ApiRequest& r) { return this->activities(r); });
    add_route("POST", "/api/llm/complete", [this](const ApiRequest& r) { return complete(r); });
}

void ControlApi::add_route(const std::string& method, const std::string& path, RouteFn fn) {
    routes_[path][method] = std::move(fn);
}

ApiResponse ControlApi::handle(const ApiRequest& request) {
    std::string path = request.path;
    if (path.size() > 1 && path.back() == '/') path.pop_back();

    auto route = routes_.find(path);
    if (route == routes_.end()) {
        return error_response(404, "Not found: " + request.path);
    }
    auto method = route->second.find(request.method);
    if (method == route->second.end()) {
        return error_response(405, "Method " + request.method + " not allowed on " + path);
    }

    if (debug_enabled()) {
        std::cerr << "[server] " << request.method << " " << path << "\n";
    }

    try {
        return method->second(request);
    } catch (const CapacityExceeded& e) {
        return error_response(429, e.what());
    } catch (const std::invalid_argument& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[server] " << request.method << " " << path << " failed: "
                  << e.what() << "\n";
        return error_response(500, e.what());
    }
}

// ── Routes ──────────────────────────────────────────────────────

ApiResponse ControlApi::health(const ApiRequest&) {
    return json_response(200, {{"status", "ok"}});
}

ApiResponse ControlApi::cache_stats(const ApiRequest&) {
    CacheMetrics m = pipeline_.cache().metrics();
    CacheSettings s = pipeline_.cache().settings();
    return json_response(200, {
        {"size", m.size},
        {"hitRate", m.hit_rate},
        {"hits", m.hits},
        {"misses", m.misses},
        {"coalesced", m.coalesced},
        {"evictions", m.evictions},
        {"expired", m.expired},
        {"inFlight", pipeline_.cache().in_flight()},
        {"ttlInSeconds", s.ttl.count()},
        {"maxSize", s.max_size}
    });
}

ApiResponse ControlApi::cache_clear(const ApiRequest&) {
    pipeline_.cache().clear();
    return json_response(200, {{"success", true}});
}

ApiResponse ControlApi::cache_settings(const ApiRequest& req) {
    nlohmann::json body = parse_body(req);
    uint32_t ttl = require_positive_int(body, "ttlInSeconds");
    std::optional<size_t> max_size;
    if (body.contains("maxSize")) {
        max_size = require_positive_int(body, "maxSize");
    }

    pipeline_.cache().configure(std::chrono::seconds(ttl), max_size);
    CacheSettings s = pipeline_.cache().settings();
    return json_response(200, {
        {"success", true},
        {"ttlInSeconds", s.ttl.count()},
        {"maxSize", s.max_size}
    });
}

ApiResponse ControlApi::get_provider(const ApiRequest&) {
    return json_response(200, {
        {"provider", llm_.default_provider()},
        {"available", llm_.provider_names()}
    });
}

ApiResponse ControlApi::set_provider(const ApiRequest& req) {
    nlohmann::json body = parse_body(req);
    auto provider = optional_string(body, "provider");
    if (!provider || provider->empty()) {
        throw std::invalid_argument("provider is required");
    }
    llm_.set_default_provider(*provider);
    return json_response(200, {{"success", true}, {"provider", *provider}});
}

ApiResponse ControlApi::thread_stats(const ApiRequest&) {
    GateStats s = gate_.stats();
    return json_response(200, {
        {"activeThreads", s.active},
        {"maxThreads", s.capacity},
        {"availableThreads", s.available}
    });
}

ApiResponse ControlApi::system_stats(const ApiRequest&) {
    nlohmann::json j = stats_.to_json();
    GateStats s = gate_.stats();
    j["activeThreads"] = s.active;
    j["threadLimit"] = s.capacity;
    return json_response(200, j);
}

ApiResponse ControlApi::activities(const ApiRequest& req) {
    size_t limit = kDefaultActivityLimit;
    std::string raw = req.query_param("limit");
    if (!raw.empty()) {
        auto parsed = parse_positive_uint(raw);
        if (!parsed) throw std::invalid_argument("limit must be a positive integer");
        limit = *parsed;
    }

    nlohmann::json out = nlohmann::json::array();
    for (const auto& rec : activities_.recent(limit)) {
        out.push_back(activity_to_json(rec));
    }
    return json_response(200, out);
}

ApiResponse ControlApi::complete(const ApiRequest& req) {
    CompletionRequest request = parse_completion_request(parse_body(req));
    if (request.provider && !llm_.has_provider(*request.provider)) {
        throw std::invalid_argument("Unsupported LLM provider: " + *request.provider);
    }

    Resolution res;
    try {
        res = pipeline_.complete(request);
    } catch (const CapacityExceeded&) {
        throw;
    } catch (const std::exception& e) {
        return error_response(502, e.what());
    }

    return json_response(200, {
        {"text", res.completion.text},
        {"usage", {
            {"inputTokens", res.completion.usage.input_tokens},
            {"outputTokens", res.completion.usage.output_tokens},
            {"totalTokens", res.completion.usage.total_tokens}
        }},
        {"cached", res.source != ResolveSource::Upstream},
        {"source", resolve_source_to_string(res.source)}
    });
}

} // namespace costgate
