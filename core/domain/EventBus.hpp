#pragma once

#include "../ports/IEventBus.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace evhistory::domain {

/**
 * @brief Queued, hierarchy-aware event dispatcher
 *
 * unsubscribe() waits for an in-flight call of that handler on another thread
 * to return, and no call starts after it returns. processEvents() called from
 * a handler is a no-op; called from another thread it waits for the current
 * run to finish and then drains the queue itself.
 */
class EventBus : public ports::IEventBus {
public:
    explicit EventBus(bool verbose = false) : verbose_(verbose) {}
    ~EventBus() override = default;

    void publish(const Event& event) override;
    SubscriptionId subscribe(const TypeHandle& eventType, EventHandler handler) override;
    bool unsubscribe(SubscriptionId id) override;
    void processEvents() override;

    size_t pendingCount() const;
    size_t subscriberCount() const;

private:
    struct Subscription {
        SubscriptionId id;
        TypeHandle eventType;
        EventHandler handler;
        // Held for the duration of each call; recursive so a handler may unsubscribe itself
        std::recursive_mutex callMutex;
        bool active = true;
    };
    using SubscriptionPtr = std::shared_ptr<Subscription>;

    void dispatch(const Event& event);

    std::vector<SubscriptionPtr> subscriptions_;
    mutable std::mutex subscriptionMutex_;
    SubscriptionId nextId_ = 1;

    std::queue<Event> eventQueue_;
    mutable std::mutex queueMutex_;
    std::mutex processingMutex_;
    std::atomic<std::thread::id> processingThread_{};
    bool verbose_;
};

} // namespace evhistory::domain
