#pragma once
#include "provider.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>

namespace costgate {

class EventBus;
class AdmissionGate;

// Thrown by run/execute/submit when every slot is taken.
class CapacityExceeded : public std::runtime_error {
public:
    CapacityExceeded(uint32_t active, uint32_t capacity)
        : std::runtime_error("Thread limit reached (" + std::to_string(active) + "/" +
                             std::to_string(capacity) + "). Try again later."),
          active_(active), capacity_(capacity) {}

    uint32_t active() const { return active_; }
    uint32_t capacity() const { return capacity_; }

private:
    uint32_t active_;
    uint32_t capacity_;
};

struct GateStats {
    uint32_t active = 0;
    uint32_t capacity = 0;
    uint32_t available = 0;
};

// Output of an opaque unit of work run under the gate.
struct TaskResult {
    std::string output;
    TokenUsage usage;
};

using Task = std::function<TaskResult(const nlohmann::json& payload)>;

// Move-only proof of admission. Gives its slot back exactly once: on
// release() or on destruction, whichever comes first.
class AdmissionTicket {
public:
    AdmissionTicket(AdmissionTicket&& other) noexcept;
    AdmissionTicket& operator=(AdmissionTicket&& other) noexcept;
    AdmissionTicket(const AdmissionTicket&) = delete;
    AdmissionTicket& operator=(const AdmissionTicket&) = delete;
    ~AdmissionTicket();

    void release();
    bool held() const { return gate_ != nullptr; }
    const std::string& description() const { return description_; }

private:
    friend class AdmissionGate;
    AdmissionTicket(AdmissionGate* gate, std::string description);

    AdmissionGate* gate_ = nullptr;
    std::string description_;
};

// Counting gate that caps concurrent costly operations.
//
// Admission never blocks and never queues: a full gate rejects at once and
// the caller decides whether to retry. The counter is a single atomic, so two
// callers can never both take the last slot.
//
// When an EventBus is attached, every admission, release and rejection is
// published. Subscriber failures are contained by the bus and never reach
// the admitted work.
class AdmissionGate {
public:
    explicit AdmissionGate(uint32_t capacity, EventBus* bus = nullptr);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // nullopt when full.
    std::optional<AdmissionTicket> try_admit(const std::string& description);

    // Throws std::invalid_argument for a ticket issued by another gate.
    // A ticket that was already released is a no-op.
    void release(AdmissionTicket& ticket);

    GateStats stats() const;
    uint32_t capacity() const { return capacity_; }

    // Admit (or throw CapacityExceeded), run fn, release on every exit path.
    template<typename Fn>
    auto run(const std::string& description, Fn&& fn) -> decltype(fn()) {
        auto ticket = try_admit(description);
        if (!ticket) throw CapacityExceeded(stats().active, capacity_);
        return fn();
    }

    TaskResult execute(const std::string& description, const Task& task,
                       const nlohmann::json& payload);

    // Admits on the calling thread (throws CapacityExceeded when full), then
    // runs the task on a dedicated thread that owns the slot until it finishes.
    // The returned future comes from std::async: destroying it blocks until
    // the task completes, so discarding it makes the call synchronous.
    std::future<TaskResult> submit(const std::string& description, Task task,
                                   nlohmann::json payload);

private:
    friend class AdmissionTicket;
    void release_slot(const std::string& description);

    const uint32_t capacity_;
    EventBus* bus_;
    std::atomic<uint32_t> active_{0};
};

} // namespace costgate
