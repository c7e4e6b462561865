#pragma once
#include "provider.hpp"
#include "config.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace costgate {

class EventBus;
class HttpClient;

// Routes completion requests to named upstream providers and owns the
// process-wide default provider.
class LlmService {
public:
    // Instantiates every registered provider. Missing credentials are not an
    // error here; that provider fails on first use instead.
    LlmService(const Config& config, HttpClient& http, EventBus* bus = nullptr);

    // For tests: supply the provider set directly.
    LlmService(std::map<std::string, std::unique_ptr<Provider>> providers,
               const std::string& default_provider, EventBus* bus = nullptr);

    // Logs, publishes ProviderErrorEvent and rethrows on failure.
    Completion complete(const CompletionRequest& request);

    // request.provider if set, else the current default.
    std::string resolve_provider(const CompletionRequest& request) const;

    // Throws std::invalid_argument for unknown names (state unchanged).
    void set_default_provider(const std::string& name);
    std::string default_provider() const;

    bool has_provider(const std::string& name) const;
    std::vector<std::string> provider_names() const;

private:
    Provider& provider_for(const std::string& name) const;

    std::map<std::string, std::unique_ptr<Provider>> providers_;
    EventBus* bus_;

    mutable std::mutex mutex_;
    std::string default_provider_;
};

} // namespace costgate
