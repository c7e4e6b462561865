#include "admission_gate.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <iostream>

namespace costgate {

// ── AdmissionTicket ─────────────────────────────────────────────

AdmissionTicket::AdmissionTicket(AdmissionGate* gate, std::string description)
    : gate_(gate), description_(std::move(description)) {}

AdmissionTicket::AdmissionTicket(AdmissionTicket&& other) noexcept
    : gate_(other.gate_), description_(std::move(other.description_)) {
    other.gate_ = nullptr;
}

AdmissionTicket& AdmissionTicket::operator=(AdmissionTicket&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        description_ = std::move(other.description_);
        other.gate_ = nullptr;
    }
    return *this;
}

AdmissionTicket::~AdmissionTicket() {
    release();
}

void AdmissionTicket::release() {
    if (!gate_) return;
    AdmissionGate* gate = gate_;
    gate_ = nullptr;
    gate->release_slot(description_);
}

// ── AdmissionGate ───────────────────────────────────────────────

AdmissionGate::AdmissionGate(uint32_t capacity, EventBus* bus)
    : capacity_(capacity), bus_(bus) {
    if (capacity_ == 0) {
        throw std::invalid_argument("AdmissionGate capacity must be at least 1");
    }
    std::cerr << "[gate] Initialized with " << capacity_ << " max threads\n";
}

std::optional<AdmissionTicket> AdmissionGate::try_admit(const std::string& description) {
    uint32_t current = active_.load();
    while (current < capacity_) {
        if (active_.compare_exchange_weak(current, current + 1)) {
            if (debug_enabled()) {
                std::cerr << "[gate] Allocating thread for " << description
                          << ". Active threads: " << (current + 1) << "/" << capacity_ << "\n";
            }
            // Ticket first: if a subscriber throws, unwinding gives the slot back.
            AdmissionTicket ticket(this, description);
            SlotAdmittedEvent ev;
            ev.description = description;
            ev.active = current + 1;
            ev.capacity = capacity_;
            publish_to(bus_, ev);
            return std::optional<AdmissionTicket>(std::move(ticket));
        }
    }

    std::cerr << "[gate] Thread limit reached: " << current << "/" << capacity_
              << " (rejected: " << description << ")\n";
    SlotRejectedEvent ev;
    ev.description = description;
    ev.active = current;
    ev.capacity = capacity_;
    publish_to(bus_, ev);
    return std::nullopt;
}

void AdmissionGate::release(AdmissionTicket& ticket) {
    if (!ticket.held()) return;
    if (ticket.gate_ != this) {
        throw std::invalid_argument("ticket was issued by a different gate");
    }
    ticket.release();
}

void AdmissionGate::release_slot(const std::string& description) {
    uint32_t now_active = active_.fetch_sub(1) - 1;
    if (debug_enabled()) {
        std::cerr << "[gate] Thread released. Active threads: "
                  << now_active << "/" << capacity_ << "\n";
    }
    SlotReleasedEvent ev;
    ev.description = description;
    ev.active = now_active;
    ev.capacity = capacity_;
    publish_to(bus_, ev);
}

GateStats AdmissionGate::stats() const {
    GateStats s;
    s.active = active_.load();
    s.capacity = capacity_;
    s.available = s.active < capacity_ ? capacity_ - s.active : 0;
    return s;
}

TaskResult AdmissionGate::execute(const std::string& description, const Task& task,
                                  const nlohmann::json& payload) {
    return run(description, [&] { return task(payload); });
}

std::future<TaskResult> AdmissionGate::submit(const std::string& description, Task task,
                                              nlohmann::json payload) {
    auto ticket = try_admit(description);
    if (!ticket) throw CapacityExceeded(stats().active, capacity_);

    // The async state may outlive the call, so the slot is moved into a local
    // that is destroyed as soon as the task returns or throws.
    return std::async(std::launch::async,
        [ticket = std::move(*ticket), task = std::move(task),
         payload = std::move(payload)]() mutable {
            AdmissionTicket slot = std::move(ticket);
            return task(payload);
        });
}

} // namespace costgate
