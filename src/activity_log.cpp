#include "activity_log.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <algorithm>

namespace costgate {

ActivityLog::ActivityLog(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

ActivityLog::~ActivityLog() {
    detach();
}

void ActivityLog::record(ActivityType type, std::string description,
                         nlohmann::json metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActivityRecord rec;
    rec.id = next_id_++;
    rec.type = type;
    rec.description = std::move(description);
    rec.metadata = std::move(metadata);
    rec.timestamp = timestamp_now();
    records_.push_back(std::move(rec));
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
}

std::vector<ActivityRecord> ActivityLog::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ActivityRecord> out;
    out.reserve(std::min(limit, records_.size()));
    for (auto it = records_.rbegin(); it != records_.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

size_t ActivityLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void ActivityLog::attach(EventBus& bus) {
    detach();
    bus_ = &bus;

    subscriptions_.push_back(subscribe<SlotAdmittedEvent>(bus,
        [this](const SlotAdmittedEvent& ev) {
            record(ActivityType::ThreadAllocation,
                   "Thread allocated for: " + ev.description,
                   {{"activeThreads", ev.active}, {"maxThreads", ev.capacity}});
        }));

    subscriptions_.push_back(subscribe<SlotReleasedEvent>(bus,
        [this](const SlotReleasedEvent& ev) {
            record(ActivityType::ThreadAllocation,
                   "Thread released for: " + ev.description,
                   {{"activeThreads", ev.active}, {"maxThreads", ev.capacity}});
        }));

    subscriptions_.push_back(subscribe<SlotRejectedEvent>(bus,
        [this](const SlotRejectedEvent& ev) {
            record(ActivityType::SystemError,
                   "Thread limit reached, rejected: " + ev.description,
                   {{"activeThreads", ev.active}, {"maxThreads", ev.capacity}});
        }));

    subscriptions_.push_back(subscribe<ProviderResponseEvent>(bus,
        [this](const ProviderResponseEvent& ev) {
            record(ActivityType::ApiCall,
                   "LLM call to " + ev.provider +
                       (ev.description.empty() ? "" : " for: " + ev.description),
                   {{"provider", ev.provider},
                    {"inputTokens", ev.usage.input_tokens},
                    {"outputTokens", ev.usage.output_tokens},
                    {"totalTokens", ev.usage.total_tokens}});
        }));

    subscriptions_.push_back(subscribe<ProviderErrorEvent>(bus,
        [this](const ProviderErrorEvent& ev) {
            record(ActivityType::SystemError,
                   "LLM call to " + ev.provider + " failed: " + ev.error,
                   {{"provider", ev.provider}});
        }));

    subscriptions_.push_back(subscribe<ProviderChangedEvent>(bus,
        [this](const ProviderChangedEvent& ev) {
            record(ActivityType::Configuration,
                   "Default LLM provider changed to: " + ev.provider,
                   {{"previous", ev.previous}, {"provider", ev.provider}});
        }));

    subscriptions_.push_back(subscribe<CacheClearedEvent>(bus,
        [this](const CacheClearedEvent& ev) {
            record(ActivityType::Configuration, "LLM response cache cleared",
                   {{"entriesRemoved", ev.entries_removed}});
        }));

    subscriptions_.push_back(subscribe<CacheConfiguredEvent>(bus,
        [this](const CacheConfiguredEvent& ev) {
            record(ActivityType::Configuration, "LLM cache settings updated",
                   {{"ttlInSeconds", ev.ttl_seconds}, {"maxSize", ev.max_size}});
        }));
}

void ActivityLog::detach() {
    if (!bus_) return;
    for (uint64_t id : subscriptions_) {
        bus_->unsubscribe(id);
    }
    subscriptions_.clear();
    bus_ = nullptr;
}

nlohmann::json activity_to_json(const ActivityRecord& record) {
    return {
        {"id", record.id},
        {"type", activity_type_to_string(record.type)},
        {"description", record.description},
        {"metadata", record.metadata},
        {"timestamp", record.timestamp}
    };
}

} // namespace costgate
