#include "system_stats.hpp"
#include "event_bus.hpp"

namespace costgate {

SystemStats::SystemStats(uint32_t thread_limit) : thread_limit_(thread_limit) {}

SystemStats::~SystemStats() {
    detach();
}

void SystemStats::attach(EventBus& bus) {
    detach();
    bus_ = &bus;

    subscriptions_.push_back(subscribe<SlotAdmittedEvent>(bus,
        [this](const SlotAdmittedEvent& ev) {
            active_threads_.store(ev.active);
            thread_limit_.store(ev.capacity);
        }));
    subscriptions_.push_back(subscribe<SlotReleasedEvent>(bus,
        [this](const SlotReleasedEvent& ev) {
            active_threads_.store(ev.active);
            thread_limit_.store(ev.capacity);
        }));
    subscriptions_.push_back(subscribe<ProviderResponseEvent>(bus,
        [this](const ProviderResponseEvent& ev) {
            record_api_call(ev.usage.total_tokens);
        }));
}

void SystemStats::detach() {
    if (!bus_) return;
    for (uint64_t id : subscriptions_) {
        bus_->unsubscribe(id);
    }
    subscriptions_.clear();
    bus_ = nullptr;
}

void SystemStats::record_api_call(uint64_t tokens) {
    api_calls_.fetch_add(1);
    api_tokens_used_.fetch_add(tokens);
}

SystemStatsSnapshot SystemStats::snapshot() const {
    SystemStatsSnapshot s;
    s.active_threads = active_threads_.load();
    s.thread_limit = thread_limit_.load();
    s.api_tokens_used = api_tokens_used_.load();
    s.api_calls = api_calls_.load();
    return s;
}

nlohmann::json SystemStats::to_json() const {
    auto s = snapshot();
    return {
        {"activeThreads", s.active_threads},
        {"threadLimit", s.thread_limit},
        {"apiTokensUsed", s.api_tokens_used},
        {"apiCalls", s.api_calls}
    };
}

} // namespace costgate
