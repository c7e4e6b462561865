#pragma once
#include "provider.hpp"
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace costgate {

using ProviderFactory = std::function<std::unique_ptr<Provider>(
    const ProviderEntry& entry, HttpClient& http)>;

// Central registry for self-registering providers.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_provider(const std::string& name, ProviderFactory factory);

    std::unique_ptr<Provider> create_provider(const std::string& name,
                                              const ProviderEntry& entry,
                                              HttpClient& http) const;

    // Sorted
    std::vector<std::string> provider_names() const;
    bool has_provider(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
};

// Used at file scope in each provider .cpp
struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(name, std::move(factory));
    }
};

} // namespace costgate
