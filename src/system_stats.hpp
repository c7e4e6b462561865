#pragma once
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <vector>

namespace costgate {

class EventBus;

struct SystemStatsSnapshot {
    uint32_t active_threads = 0;
    uint32_t thread_limit = 0;
    uint64_t api_tokens_used = 0;
    uint64_t api_calls = 0;
};

// Usage counters fed by gate and provider events.
class SystemStats {
public:
    explicit SystemStats(uint32_t thread_limit = 0);
    ~SystemStats();

    SystemStats(const SystemStats&) = delete;
    SystemStats& operator=(const SystemStats&) = delete;

    void attach(EventBus& bus);
    void detach();

    void record_api_call(uint64_t tokens);
    SystemStatsSnapshot snapshot() const;
    nlohmann::json to_json() const;

private:
    std::atomic<uint32_t> active_threads_{0};
    std::atomic<uint32_t> thread_limit_;
    std::atomic<uint64_t> api_tokens_used_{0};
    std::atomic<uint64_t> api_calls_{0};

    EventBus* bus_ = nullptr;
    std::vector<uint64_t> subscriptions_;
};

} // namespace costgate
