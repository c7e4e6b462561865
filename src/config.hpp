#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace costgate {

struct ProviderEntry {
    std::string api_key;
    std::string base_url; // empty = provider default
    std::string model;    // empty = provider default
};

struct CacheConfig {
    uint32_t ttl_seconds = 300;
    uint32_t max_size = 100;
    uint32_t prune_interval = 60; // seconds between background prune sweeps
};

struct GateConfig {
    uint32_t max_threads = 8;
};

struct ServerConfig {
    std::string listen = "127.0.0.1:5000";
    uint32_t max_body = 65536;
    uint32_t activity_history = 200;
};

struct Config {
    std::string provider = "groq"; // default upstream provider

    std::unordered_map<std::string, ProviderEntry> providers;

    CacheConfig cache;
    GateConfig gate;
    ServerConfig server;

    // Load from ~/.costgate/config.json + env vars
    static Config load();

    // Load from an explicit path. Creates the file with defaults when missing
    // and migrates it when keys are absent.
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config document. Wrongly typed or out-of-range values keep
    // their defaults.
    static Config from_json(const nlohmann::json& j);

    // Environment variables always override file values.
    void apply_env();

    std::string api_key_for(const std::string& provider) const;
    std::string base_url_for(const std::string& provider) const;
    std::string model_for(const std::string& provider) const;
};

} // namespace costgate
