#pragma once
#include "chat_completions.hpp"
#include <string>

namespace costgate {

// Groq's OpenAI-compatible endpoint
class GroqProvider : public ChatCompletionsProvider {
public:
    static constexpr const char* kDefaultBaseUrl = "https://api.groq.com/openai/v1";
    static constexpr const char* kDefaultModel = "llama-3.3-70b-versatile";

    GroqProvider(const std::string& api_key, HttpClient& http,
                 const std::string& base_url = "",
                 const std::string& model = "");

    std::string provider_name() const override { return "groq"; }

protected:
    const char* api_key_env() const override { return "GROQ_API_KEY"; }
};

} // namespace costgate
