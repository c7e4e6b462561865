#pragma once
#include "cache_key.hpp"
#include "../provider.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace costgate {

class EventBus;

struct CacheSettings {
    std::chrono::seconds ttl{300};
    size_t max_size = 100;
};

struct CacheMetrics {
    size_t size = 0;
    double hit_rate = 0.0;   // hits / (hits + misses), 0 when both are 0
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t coalesced = 0;  // callers that joined an in-flight fetch
    uint64_t evictions = 0;
    uint64_t expired = 0;
};

enum class ResolveSource { Upstream, Cache, Coalesced };

inline const char* resolve_source_to_string(ResolveSource source) {
    switch (source) {
        case ResolveSource::Upstream: return "upstream";
        case ResolveSource::Cache: return "cache";
        case ResolveSource::Coalesced: return "coalesced";
    }
    return "upstream";
}

struct Resolution {
    Completion completion;
    ResolveSource source = ResolveSource::Upstream;

    bool from_cache() const { return source == ResolveSource::Cache; }
};

// Memoizing, request-coalescing cache in front of an upstream fetch.
//
// - At most one fetch per key is in flight; concurrent callers for the same
//   key wait on the same shared result and see the same value or exception.
// - Failures are never stored.
// - Entries expire ttl after creation. Expired entries are dropped lazily on
//   lookup and by prune().
// - Over max_size, the oldest-created entries go first. Reads do not refresh
//   an entry's position.
//
// All methods are thread-safe. The fetch itself runs without the lock held.
class ResponseCache {
public:
    using Fetcher = std::function<Completion(const CompletionRequest&)>;
    using KeyFunction = std::function<CacheKey(const CompletionRequest&)>;
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    // key_fn defaults to make_cache_key(request, request.provider or "").
    // clock defaults to std::chrono::steady_clock::now.
    ResponseCache(Fetcher fetch,
                  KeyFunction key_fn = {},
                  CacheSettings settings = {},
                  Clock clock = {});
    ~ResponseCache();

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // Serve from cache, join an in-flight fetch, or fetch and store.
    // Rethrows the fetch's exception.
    Resolution resolve(const CompletionRequest& request);

    // Remove expired entries. Returns how many were removed.
    size_t prune();

    // Drop all entries and reset counters. In-flight fetches are unaffected
    // and still store their result when they settle.
    void clear();

    // Applies to future entries only, then prunes and evicts immediately.
    // Throws std::invalid_argument (state unchanged) if ttl < 1s or max_size < 1.
    void configure(std::chrono::seconds ttl, std::optional<size_t> max_size = std::nullopt);

    CacheMetrics metrics() const;
    CacheSettings settings() const;
    size_t in_flight() const;

    // Background prune sweep every `period`. Restarts if already running.
    void start_pruner(std::chrono::milliseconds period);
    void stop_pruner();

    void set_event_bus(EventBus* bus) { bus_ = bus; }

private:
    struct Entry {
        Completion completion;
        TimePoint created_at;
        TimePoint expires_at;
        uint64_t seq; // insertion order, breaks created_at ties
    };

    using EntryMap = std::unordered_map<CacheKey, Entry, CacheKeyHash>;
    using InFlightMap = std::unordered_map<CacheKey, std::shared_future<Completion>, CacheKeyHash>;

    // Must be called with mutex_ held.
    size_t prune_locked(TimePoint now);
    void evict_locked();
    void store_locked(const CacheKey& key, const Completion& completion);

    void pruner_loop(std::chrono::milliseconds period);

    Fetcher fetch_;
    KeyFunction key_fn_;
    Clock clock_;
    EventBus* bus_ = nullptr;

    mutable std::mutex mutex_;
    CacheSettings settings_;
    EntryMap entries_;
    InFlightMap in_flight_;
    uint64_t next_seq_ = 0;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t coalesced_ = 0;
    uint64_t evictions_ = 0;
    uint64_t expired_ = 0;

    std::mutex pruner_mutex_;
    std::condition_variable pruner_cv_;
    bool pruner_stop_ = false;
    std::thread pruner_;
};

} // namespace costgate
