#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace costgate {

class EventBus;

enum class ActivityType { ApiCall, ThreadAllocation, Configuration, SystemError };

inline const char* activity_type_to_string(ActivityType type) {
    switch (type) {
        case ActivityType::ApiCall: return "api_call";
        case ActivityType::ThreadAllocation: return "thread_allocation";
        case ActivityType::Configuration: return "configuration";
        case ActivityType::SystemError: return "system_error";
    }
    return "system_error";
}

struct ActivityRecord {
    uint64_t id = 0;
    ActivityType type = ActivityType::ApiCall;
    std::string description;
    nlohmann::json metadata;
    std::string timestamp;
};

// Bounded in-memory activity feed. Oldest records are dropped once
// `capacity` is reached.
class ActivityLog {
public:
    explicit ActivityLog(size_t capacity = 200);
    ~ActivityLog();

    ActivityLog(const ActivityLog&) = delete;
    ActivityLog& operator=(const ActivityLog&) = delete;

    void record(ActivityType type, std::string description,
                nlohmann::json metadata = nlohmann::json::object());

    // Most recent first, at most `limit` records.
    std::vector<ActivityRecord> recent(size_t limit) const;
    size_t size() const;

    // Subscribe to gate, provider and cache events. The bus must outlive
    // this log or detach() must be called first.
    void attach(EventBus& bus);
    void detach();

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<ActivityRecord> records_;
    uint64_t next_id_ = 1;

    EventBus* bus_ = nullptr;
    std::vector<uint64_t> subscriptions_;
};

nlohmann::json activity_to_json(const ActivityRecord& record);

} // namespace costgate
