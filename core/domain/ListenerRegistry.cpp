#include "ListenerRegistry.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace evhistory::domain {

ListenerRegistry::ListenerRegistry(ActivationController& activation)
    : activation_(activation) {
}

bool ListenerRegistry::add(ListenerPtr listener) {
    if (!listener) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    bool added = false;
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(std::move(listener));
        added = true;
    }

    // Someone is listening; start recording
    activation_.processEvent(ActivationEvent::ListenerAdded);
    return added;
}

bool ListenerRegistry::remove(const ListenerPtr& listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(listeners_.begin(), listeners_.end(), listener);
    bool removed = it != listeners_.end();
    if (removed) {
        listeners_.erase(it);
    }

    if (listeners_.empty()) {
        // No one is listening; stop recording
        activation_.processEvent(ActivationEvent::LastListenerRemoved);
    }
    return removed;
}

void ListenerRegistry::removeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.clear();
    activation_.processEvent(ActivationEvent::LastListenerRemoved);
}

void ListenerRegistry::notifyAll(const EventRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& listener : listeners_) {
        try {
            listener->eventOccurred(record);
        } catch (const std::exception& e) {
            std::cerr << "[History] Listener failed on #" << record.occurredAt()
                      << " (" << record.eventType().name() << "): " << e.what() << std::endl;
        }
    }
}

size_t ListenerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

bool ListenerRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.empty();
}

} // namespace evhistory::domain
