#pragma once
#include "cache/response_cache.hpp"
#include <string>

namespace costgate {

class AdmissionGate;
class EventBus;
class LlmService;

// Cache in front, gate around the upstream call: hits and coalesced joins
// never take a slot, only the single leader fetch per key does.
class CompletionPipeline {
public:
    CompletionPipeline(LlmService& llm, AdmissionGate& gate,
                       CacheSettings settings = {}, EventBus* bus = nullptr,
                       ResponseCache::Clock clock = {});

    CompletionPipeline(const CompletionPipeline&) = delete;
    CompletionPipeline& operator=(const CompletionPipeline&) = delete;

    // Pins the provider (request or current default) before the cache lookup,
    // so a default switch mid-flight cannot mix keys and upstreams.
    // Throws CapacityExceeded or the upstream's error.
    Resolution complete(const CompletionRequest& request);

    ResponseCache& cache() { return cache_; }
    const ResponseCache& cache() const { return cache_; }

private:
    Completion fetch(const CompletionRequest& request);

    LlmService& llm_;
    AdmissionGate& gate_;
    ResponseCache cache_;
};

} // namespace costgate
