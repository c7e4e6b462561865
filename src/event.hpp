#pragma once
#include "provider.hpp"
#include <string>
#include <cstdint>

namespace costgate {

// Tag-based event dispatch — no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* SlotAdmitted     = "SlotAdmitted";
    constexpr const char* SlotReleased     = "SlotReleased";
    constexpr const char* SlotRejected     = "SlotRejected";
    constexpr const char* ProviderResponse = "ProviderResponse";
    constexpr const char* ProviderError    = "ProviderError";
    constexpr const char* ProviderChanged  = "ProviderChanged";
    constexpr const char* CacheCleared     = "CacheCleared";
    constexpr const char* CacheConfigured  = "CacheConfigured";
} // namespace event_tags

// ── Admission gate lifecycle ────────────────────────────────────

// active is the count after the transition.
struct SlotAdmittedEvent : Event {
    static constexpr const char* TAG = event_tags::SlotAdmitted;
    std::string description;
    uint32_t active = 0;
    uint32_t capacity = 0;

    SlotAdmittedEvent() { type_tag = TAG; }
};

struct SlotReleasedEvent : Event {
    static constexpr const char* TAG = event_tags::SlotReleased;
    std::string description;
    uint32_t active = 0;
    uint32_t capacity = 0;

    SlotReleasedEvent() { type_tag = TAG; }
};

struct SlotRejectedEvent : Event {
    static constexpr const char* TAG = event_tags::SlotRejected;
    std::string description;
    uint32_t active = 0;
    uint32_t capacity = 0;

    SlotRejectedEvent() { type_tag = TAG; }
};

// ── Upstream calls ──────────────────────────────────────────────

struct ProviderResponseEvent : Event {
    static constexpr const char* TAG = event_tags::ProviderResponse;
    std::string provider;
    std::string description;
    TokenUsage usage;

    ProviderResponseEvent() { type_tag = TAG; }
};

struct ProviderErrorEvent : Event {
    static constexpr const char* TAG = event_tags::ProviderError;
    std::string provider;
    std::string description;
    std::string error;

    ProviderErrorEvent() { type_tag = TAG; }
};

struct ProviderChangedEvent : Event {
    static constexpr const char* TAG = event_tags::ProviderChanged;
    std::string previous;
    std::string provider;

    ProviderChangedEvent() { type_tag = TAG; }
};

// ── Cache maintenance ───────────────────────────────────────────

struct CacheClearedEvent : Event {
    static constexpr const char* TAG = event_tags::CacheCleared;
    size_t entries_removed = 0;

    CacheClearedEvent() { type_tag = TAG; }
};

struct CacheConfiguredEvent : Event {
    static constexpr const char* TAG = event_tags::CacheConfigured;
    uint32_t ttl_seconds = 0;
    size_t max_size = 0;

    CacheConfiguredEvent() { type_tag = TAG; }
};

} // namespace costgate
