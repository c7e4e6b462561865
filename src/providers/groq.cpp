#include "groq.hpp"
#include "../plugin.hpp"

static costgate::ProviderRegistrar reg_groq("groq",
    [](const costgate::ProviderEntry& entry, costgate::HttpClient& http) {
        return std::make_unique<costgate::GroqProvider>(
            entry.api_key, http, entry.base_url, entry.model);
    });

namespace costgate {

GroqProvider::GroqProvider(const std::string& api_key, HttpClient& http,
                           const std::string& base_url,
                           const std::string& model)
    : ChatCompletionsProvider(api_key, http,
          (base_url.empty() ? std::string(kDefaultBaseUrl) : base_url) + "/chat/completions",
          model.empty() ? kDefaultModel : model) {}

} // namespace costgate
