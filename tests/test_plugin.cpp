#include <catch2/catch.hpp>
#include "plugin.hpp"
#include "mock_http_client.hpp"
#include <algorithm>

using namespace costgate;

TEST_CASE("PluginRegistry: built-in providers are registered", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    REQUIRE(reg.has_provider("groq"));
    REQUIRE(reg.has_provider("phidata"));
    REQUIRE_FALSE(reg.has_provider("nonexistent"));
}

TEST_CASE("PluginRegistry: provider_names is sorted", "[plugin]") {
    auto names = PluginRegistry::instance().provider_names();
    REQUIRE(std::is_sorted(names.begin(), names.end()));
    REQUIRE(std::find(names.begin(), names.end(), "groq") != names.end());
}

TEST_CASE("PluginRegistry: create_provider builds the named provider", "[plugin]") {
    MockHttpClient http;
    ProviderEntry entry;
    entry.api_key = "k";
    auto p = create_provider("phidata", entry, http);
    REQUIRE(p->provider_name() == "phidata");
    REQUIRE(p->is_configured());
}

TEST_CASE("PluginRegistry: unknown provider throws", "[plugin]") {
    MockHttpClient http;
    REQUIRE_THROWS_AS(create_provider("nonexistent", ProviderEntry{}, http),
                      std::invalid_argument);
}
