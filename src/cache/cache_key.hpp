#pragma once
#include "../provider.hpp"
#include <cstdint>
#include <string>

namespace costgate {

// Fingerprint of the semantically relevant request fields.
//
// `canonical` is a JSON object with sorted keys, so the fingerprint does not
// depend on the order fields were set in. Equality compares the canonical
// form too, so two distinct requests can never share an entry even on a
// hash collision.
struct CacheKey {
    uint64_t hash = 0;
    std::string canonical;

    bool operator==(const CacheKey& other) const {
        return hash == other.hash && canonical == other.canonical;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

    // Hex form for logging
    std::string to_string() const;
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const noexcept {
        return static_cast<size_t>(key.hash);
    }
};

// Build the key for `request` as it would be sent to `provider`.
// Unset optional fields are normalized to the provider defaults, so an
// omitted temperature and an explicit 0.7 produce the same key.
// Metadata (description, skip_cache) is ignored.
CacheKey make_cache_key(const CompletionRequest& request, const std::string& provider);

// 64-bit FNV-1a
uint64_t fnv1a_64(const std::string& data);

} // namespace costgate
