#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace costgate {

// Shared implementation for upstreams that speak the OpenAI-style
// chat-completions wire format. Subclasses supply endpoint defaults and the
// name of the environment variable that carries the key.
class ChatCompletionsProvider : public Provider {
public:
    ChatCompletionsProvider(const std::string& api_key, HttpClient& http,
                            const std::string& endpoint,
                            const std::string& model);

    Completion complete(const CompletionRequest& request) override;

    bool is_configured() const override { return !api_key_.empty(); }

    const std::string& endpoint() const { return endpoint_; }
    const std::string& model() const { return model_; }

protected:
    // e.g. "GROQ_API_KEY"; used in the missing-credentials error.
    virtual const char* api_key_env() const = 0;

    nlohmann::json build_request(const CompletionRequest& request) const;
    std::vector<Header> build_headers() const;
    Completion parse_response(const std::string& body) const;

private:
    std::string api_key_;
    HttpClient& http_;
    std::string endpoint_;
    std::string model_;
};

} // namespace costgate
