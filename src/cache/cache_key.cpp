#include "cache_key.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>

namespace costgate {

std::string CacheKey::to_string() const {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

uint64_t fnv1a_64(const std::string& data) {
    constexpr uint64_t fnv_offset = 14695981039346656037ULL;
    constexpr uint64_t fnv_prime  = 1099511628211ULL;

    uint64_t hash = fnv_offset;
    for (unsigned char byte : data) {
        hash ^= byte;
        hash *= fnv_prime;
    }
    return hash;
}

CacheKey make_cache_key(const CompletionRequest& request, const std::string& provider) {
    // nlohmann::json objects are std::map backed: dump() emits sorted keys.
    nlohmann::json fields;
    fields["prompt"] = request.prompt;
    fields["provider"] = provider;
    fields["system"] = request.system.value_or("");
    fields["temperature"] = request.temperature.value_or(kDefaultTemperature);
    fields["max_tokens"] = request.max_tokens.value_or(kDefaultMaxTokens);
    fields["top_p"] = request.top_p.value_or(kDefaultTopP);
    fields["stop"] = request.stop_sequences;

    CacheKey key;
    key.canonical = fields.dump();
    key.hash = fnv1a_64(key.canonical);
    return key;
}

} // namespace costgate
