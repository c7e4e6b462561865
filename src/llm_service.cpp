#include "llm_service.hpp"
#include "event_bus.hpp"
#include "plugin.hpp"
#include <iostream>
#include <stdexcept>

namespace costgate {

static std::map<std::string, std::unique_ptr<Provider>> build_providers(
        const Config& config, HttpClient& http) {
    std::map<std::string, std::unique_ptr<Provider>> providers;
    for (const auto& name : PluginRegistry::instance().provider_names()) {
        ProviderEntry entry;
        auto it = config.providers.find(name);
        if (it != config.providers.end()) entry = it->second;

        auto provider = create_provider(name, entry, http);
        if (provider->is_configured()) {
            std::cerr << "[llm] " << name << " provider initialized\n";
        } else {
            std::cerr << "[llm] Warning: no API key for " << name
                      << "; requests to it will fail\n";
        }
        providers.emplace(name, std::move(provider));
    }
    return providers;
}

LlmService::LlmService(const Config& config, HttpClient& http, EventBus* bus)
    : LlmService(build_providers(config, http), config.provider, bus) {}

LlmService::LlmService(std::map<std::string, std::unique_ptr<Provider>> providers,
                       const std::string& default_provider, EventBus* bus)
    : providers_(std::move(providers)), bus_(bus), default_provider_(default_provider) {
    if (providers_.empty()) {
        throw std::invalid_argument("LlmService requires at least one provider");
    }
    if (providers_.count(default_provider_) == 0) {
        std::string fallback = providers_.begin()->first;
        std::cerr << "[llm] Unknown default provider '" << default_provider_
                  << "', using " << fallback << "\n";
        default_provider_ = fallback;
    }
    std::cerr << "[llm] LLM service initialized with default provider: "
              << default_provider_ << "\n";
}

Provider& LlmService::provider_for(const std::string& name) const {
    auto it = providers_.find(name);
    if (it == providers_.end()) {
        throw std::invalid_argument("Unsupported LLM provider: " + name);
    }
    return *it->second;
}

std::string LlmService::resolve_provider(const CompletionRequest& request) const {
    if (request.provider && !request.provider->empty()) return *request.provider;
    std::lock_guard<std::mutex> lock(mutex_);
    return default_provider_;
}

Completion LlmService::complete(const CompletionRequest& request) {
    std::string name = resolve_provider(request);
    try {
        Completion result = provider_for(name).complete(request);

        ProviderResponseEvent ev;
        ev.provider = name;
        ev.description = request.description;
        ev.usage = result.usage;
        publish_to(bus_, ev);
        return result;
    } catch (const std::exception& e) {
        std::cerr << "[llm] LLM service error (" << name << "): " << e.what() << "\n";
        ProviderErrorEvent ev;
        ev.provider = name;
        ev.description = request.description;
        ev.error = e.what();
        publish_to(bus_, ev);
        throw;
    }
}

void LlmService::set_default_provider(const std::string& name) {
    if (providers_.count(name) == 0) {
        throw std::invalid_argument("Unsupported LLM provider: " + name);
    }
    ProviderChangedEvent ev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ev.previous = default_provider_;
        default_provider_ = name;
    }
    ev.provider = name;
    std::cerr << "[llm] Default LLM provider changed to: " << name << "\n";
    publish_to(bus_, ev);
}

std::string LlmService::default_provider() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_provider_;
}

bool LlmService::has_provider(const std::string& name) const {
    return providers_.count(name) > 0;
}

std::vector<std::string> LlmService::provider_names() const {
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& [name, _] : providers_) {
        names.push_back(name);
    }
    return names;
}

} // namespace costgate
