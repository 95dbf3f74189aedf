#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <cstdint>

namespace middleman {

using EventHandler = std::function<void(const Event&)>;

// Fire-and-forget notification channel. The cache engine and the proxy
// coordinator each own one; observers attach by event tag.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID (never 0).
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Deliver to every handler for the event's tag, in registration order.
    // Handlers run on the publishing thread with no lock held, so a handler
    // may subscribe, unsubscribe or publish.
    void publish(const Event& event);

    void clear();

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        std::string tag;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Unsubscribes on destruction. The bus must outlive the guard.
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    ScopedSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() { reset(); }

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : bus_(other.bus_), id_(other.id_) {
        other.bus_ = nullptr;
        other.id_ = 0;
    }
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = other.bus_;
            id_ = other.id_;
            other.bus_ = nullptr;
            other.id_ = 0;
        }
        return *this;
    }
    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    void reset() {
        if (bus_ && id_ != 0) bus_->unsubscribe(id_);
        bus_ = nullptr;
        id_ = 0;
    }

    uint64_t id() const { return id_; }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

} // namespace middleman
