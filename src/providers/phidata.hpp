#pragma once
#include "chat_completions.hpp"
#include <string>

namespace costgate {

// Phidata hosted completions. Same wire format, different path.
class PhidataProvider : public ChatCompletionsProvider {
public:
    static constexpr const char* kDefaultBaseUrl = "https://api.phidata.com/v1";
    static constexpr const char* kDefaultModel = "claude-3-5-sonnet";

    PhidataProvider(const std::string& api_key, HttpClient& http,
                    const std::string& base_url = "",
                    const std::string& model = "");

    std::string provider_name() const override { return "phidata"; }

protected:
    const char* api_key_env() const override { return "PHIDATA_API_KEY"; }
};

} // namespace costgate
