#include "provider.hpp"
#include "plugin.hpp"

namespace costgate {

std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const ProviderEntry& entry,
                                          HttpClient& http) {
    return PluginRegistry::instance().create_provider(name, entry, http);
}

} // namespace costgate
