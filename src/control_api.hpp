#pragma once
#include "http_server.hpp"
#include "provider.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>

namespace costgate {

class ActivityLog;
class AdmissionGate;
class CompletionPipeline;
class LlmService;
class SystemStats;

// JSON control surface: cache stats and settings, provider selection, gate
// stats, the activity feed and a completion endpoint. Routing and validation
// live here so they can be tested without a socket.
class ControlApi {
public:
    ControlApi(CompletionPipeline& pipeline, AdmissionGate& gate, LlmService& llm,
               ActivityLog& activities, SystemStats& stats);

    // Never throws; every failure is mapped to a status code.
    ApiResponse handle(const ApiRequest& request);

    // Adapter for ControlServer.
    ControlServer::Handler handler() {
        return [this](const ApiRequest& r) { return handle(r); };
    }

private:
    using RouteFn = std::function<ApiResponse(const ApiRequest&)>;

    ApiResponse health(const ApiRequest& req);
    ApiResponse cache_stats(const ApiRequest& req);
    ApiResponse cache_clear(const ApiRequest& req);
    ApiResponse cache_settings(const ApiRequest& req);
    ApiResponse get_provider(const ApiRequest& req);
    ApiResponse set_provider(const ApiRequest& req);
    ApiResponse thread_stats(const ApiRequest& req);
    ApiResponse system_stats(const ApiRequest& req);
    ApiResponse activities(const ApiRequest& req);
    ApiResponse complete(const ApiRequest& req);

    void add_route(const std::string& method, const std::string& path, RouteFn fn);

    CompletionPipeline& pipeline_;
    AdmissionGate& gate_;
    LlmService& llm_;
    ActivityLog& activities_;
    SystemStats& stats_;

    // path -> method -> handler
    std::map<std::string, std::map<std::string, RouteFn>> routes_;
};

// Parse and validate a /api/llm/complete body. Throws std::invalid_argument
// with a client-facing message.
CompletionRequest parse_completion_request(const nlohmann::json& body);

ApiResponse json_response(int status, const nlohmann::json& body);
ApiResponse error_response(int status, const std::string& message);

} // namespace costgate
