#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <nlohmann/json.hpp>

namespace costgate {

nlohmann::json Config::defaults_json() {
    return {
        {"provider", "groq"},
        {"providers", {
            {"groq", {{"api_key", ""}, {"base_url", ""}, {"model", ""}}},
            {"phidata", {{"api_key", ""}, {"base_url", ""}, {"model", ""}}}
        }},
        {"cache", {
            {"ttl_seconds", 300},
            {"max_size", 100},
            {"prune_interval", 60}
        }},
        {"gate", {
            {"max_threads", 8}
        }},
        {"server", {
            {"listen", "127.0.0.1:5000"},
            {"max_body", 65536},
            {"activity_history", 200}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Positive integers only; zero would disable the component it sizes.
static void read_positive(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return;
    auto v = obj[key].get<uint64_t>();
    if (v >= 1 && v <= UINT32_MAX) out = static_cast<uint32_t>(v);
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    read_string(j, "provider", cfg.provider);

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            read_string(obj, "api_key", entry.api_key);
            read_string(obj, "base_url", entry.base_url);
            read_string(obj, "model", entry.model);
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        const auto& c = j["cache"];
        read_positive(c, "ttl_seconds", cfg.cache.ttl_seconds);
        read_positive(c, "max_size", cfg.cache.max_size);
        read_positive(c, "prune_interval", cfg.cache.prune_interval);
    }

    if (j.contains("gate") && j["gate"].is_object()) {
        read_positive(j["gate"], "max_threads", cfg.gate.max_threads);
    }

    if (j.contains("server") && j["server"].is_object()) {
        const auto& s = j["server"];
        read_string(s, "listen", cfg.server.listen);
        read_positive(s, "max_body", cfg.server.max_body);
        read_positive(s, "activity_history", cfg.server.activity_history);
    }

    return cfg;
}

Config Config::load_from(const std::string& path) {
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.costgate/config.json"));
}

static std::optional<uint32_t> env_positive(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    auto parsed = parse_positive_uint(v);
    if (!parsed) {
        std::cerr << "[config] Ignoring invalid " << name << "=\"" << v << "\"\n";
    }
    return parsed;
}

void Config::apply_env() {
    if (const char* v = std::getenv("GROQ_API_KEY"))
        providers["groq"].api_key = v;
    if (const char* v = std::getenv("PHIDATA_API_KEY"))
        providers["phidata"].api_key = v;
    if (const char* v = std::getenv("LLM_PROVIDER"))
        provider = v;
    if (const char* v = std::getenv("COSTGATE_LISTEN"))
        server.listen = v;

    if (auto v = env_positive("MAX_THREADS")) gate.max_threads = *v;
    if (auto v = env_positive("CACHE_TTL")) cache.ttl_seconds = *v;
    if (auto v = env_positive("CACHE_MAX_SIZE")) cache.max_size = *v;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

std::string Config::model_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.model;
    return {};
}

} // namespace costgate
