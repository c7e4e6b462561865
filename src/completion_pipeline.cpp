#include "completion_pipeline.hpp"
#include "admission_gate.hpp"
#include "llm_service.hpp"

namespace costgate {

CompletionPipeline::CompletionPipeline(LlmService& llm, AdmissionGate& gate,
                                       CacheSettings settings, EventBus* bus,
                                       ResponseCache::Clock clock)
    : llm_(llm), gate_(gate),
      cache_([this](const CompletionRequest& r) { return fetch(r); },
             {}, settings, std::move(clock)) {
    cache_.set_event_bus(bus);
}

Resolution CompletionPipeline::complete(const CompletionRequest& request) {
    CompletionRequest pinned = request;
    pinned.provider = llm_.resolve_provider(request);
    return cache_.resolve(pinned);
}

Completion CompletionPipeline::fetch(const CompletionRequest& request) {
    std::string description = request.description.empty()
        ? "LLM completion via " + request.provider.value_or(llm_.default_provider())
        : request.description;
    return gate_.run(description, [&] { return llm_.complete(request); });
}

} // namespace costgate
