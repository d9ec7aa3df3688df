#include "EventBus.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace evhistory::domain {

void EventBus::publish(const Event& event) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    eventQueue_.push(event);
}

EventBus::SubscriptionId EventBus::subscribe(const TypeHandle& eventType, EventHandler handler) {
    auto sub = std::make_shared<Subscription>();
    sub->eventType = eventType;
    sub->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(subscriptionMutex_);
    sub->id = nextId_++;
    subscriptions_.push_back(sub);
    return sub->id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    SubscriptionPtr sub;
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                               [id](const SubscriptionPtr& s) { return s->id == id; });
        if (it == subscriptions_.end()) {
            return false;
        }
        sub = *it;
        subscriptions_.erase(it);
    }

    // Wait out a call in progress on another thread
    std::lock_guard<std::recursive_mutex> call(sub->callMutex);
    sub->active = false;
    return true;
}

void EventBus::processEvents() {
    // Prevent recursive processing from inside a handler
    const auto self = std::this_thread::get_id();
    if (processingThread_.load() == self) return;

    std::lock_guard<std::mutex> processing(processingMutex_);
    processingThread_.store(self);

    struct OwnerReset {
        std::atomic<std::thread::id>& owner;
        ~OwnerReset() { owner.store(std::thread::id()); }
    } reset{processingThread_};

    while (true) {
        Event event;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (eventQueue_.empty()) break;

            event = std::move(eventQueue_.front());
            eventQueue_.pop();
        }

        dispatch(event);
    }
}

void EventBus::dispatch(const Event& event) {
    // Copy matching subscriptions out under lock, then call without lock held
    std::vector<SubscriptionPtr> toCall;
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        for (const auto& sub : subscriptions_) {
            if (sub->eventType.isAssignableFrom(event.type)) {
                toCall.push_back(sub);
            }
        }
    }

    if (toCall.empty() && verbose_) {
        std::cout << "[EventBus] No subscriber for " << event.type.name() << std::endl;
    }

    for (const auto& sub : toCall) {
        std::lock_guard<std::recursive_mutex> call(sub->callMutex);
        if (!sub->active) {
            continue; // unsubscribed by an earlier handler or another thread
        }

        try {
            sub->handler(event);
        } catch (const std::exception& e) {
            // Keep delivering to the remaining handlers
            std::cerr << "[EventBus] Handler failed for " << event.type.name()
                      << ": " << e.what() << std::endl;
        }
    }
}

size_t EventBus::pendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return eventQueue_.size();
}

size_t EventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lock(subscriptionMutex_);
    return subscriptions_.size();
}

} // namespace evhistory::domain
