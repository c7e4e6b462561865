#include "chat_completions.hpp"
#include <cstdint>
#include <stdexcept>

using json = nlohmann::json;

namespace costgate {

ChatCompletionsProvider::ChatCompletionsProvider(const std::string& api_key,
                                                 HttpClient& http,
                                                 const std::string& endpoint,
                                                 const std::string& model)
    : api_key_(api_key), http_(http), endpoint_(endpoint), model_(model) {}

json ChatCompletionsProvider::build_request(const CompletionRequest& request) const {
    json msgs = json::array();
    if (request.system && !request.system->empty()) {
        msgs.push_back({{"role", "system"}, {"content", *request.system}});
    }
    msgs.push_back({{"role", "user"}, {"content", request.prompt}});

    json body;
    body["model"] = model_;
    body["messages"] = msgs;
    body["temperature"] = request.temperature.value_or(kDefaultTemperature);
    body["max_tokens"] = request.max_tokens.value_or(kDefaultMaxTokens);
    body["top_p"] = request.top_p.value_or(kDefaultTopP);
    if (request.stop_sequences.empty()) {
        body["stop"] = nullptr;
    } else {
        body["stop"] = request.stop_sequences;
    }
    return body;
}

std::vector<Header> ChatCompletionsProvider::build_headers() const {
    return {
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"}
    };
}

static uint64_t usage_field(const json& usage, const char* key) {
    if (!usage.contains(key) || !usage[key].is_number_unsigned()) return 0;
    return usage[key].get<uint64_t>();
}

Completion ChatCompletionsProvider::parse_response(const std::string& body) const {
    json resp;
    try {
        resp = json::parse(body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(provider_name() + ": malformed response: " + e.what());
    }

    if (!resp.contains("choices") || !resp["choices"].is_array() || resp["choices"].empty()) {
        throw std::runtime_error(provider_name() + ": response has no choices");
    }
    const auto& message = resp["choices"][0].value("message", json::object());
    if (!message.contains("content") || !message["content"].is_string()) {
        throw std::runtime_error(provider_name() + ": response has no message content");
    }

    Completion result;
    result.text = message["content"].get<std::string>();
    if (resp.contains("usage") && resp["usage"].is_object()) {
        const auto& usage = resp["usage"];
        result.usage.input_tokens = usage_field(usage, "prompt_tokens");
        result.usage.output_tokens = usage_field(usage, "completion_tokens");
        result.usage.total_tokens = usage_field(usage, "total_tokens");
        if (result.usage.total_tokens == 0) {
            uint64_t in = result.usage.input_tokens;
            uint64_t out = result.usage.output_tokens;
            result.usage.total_tokens =
                in > UINT64_MAX - out ? UINT64_MAX : in + out;
        }
    }
    return result;
}

Completion ChatCompletionsProvider::complete(const CompletionRequest& request) {
    if (api_key_.empty()) {
        throw std::runtime_error(std::string(api_key_env()) +
            " environment variable is not set. Please set it to use " +
            provider_name() + " services.");
    }

    auto response = http_.post(endpoint_, build_request(request).dump(), build_headers());

    if (response.status_code == 0) {
        throw std::runtime_error(provider_name() + ": request to " + endpoint_ + " failed");
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw std::runtime_error(provider_name() + " API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    return parse_response(response.body);
}

} // namespace costgate
