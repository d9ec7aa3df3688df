#pragma once

#include "../ports/IHistoryListener.hpp"
#include "ActivationController.hpp"
#include <memory>
#include <mutex>
#include <vector>

namespace evhistory::domain {

/**
 * @brief Registered history listeners, in registration order
 *
 * add(), remove() and notifyAll() share one mutex, and the listener-driven
 * activation changes are made while it is held. Once remove() returns, the
 * removed listener is not called again.
 *
 * @warning A listener must not call add() or remove() from eventOccurred();
 *          the registry mutex is not recursive and the call would deadlock.
 */
class ListenerRegistry {
public:
    using ListenerPtr = std::shared_ptr<ports::IHistoryListener>;

    explicit ListenerRegistry(ActivationController& activation);

    // Returns false if the listener was already registered (activation is still set)
    bool add(ListenerPtr listener);

    // Returns false if the listener was not registered
    bool remove(const ListenerPtr& listener);

    // Drops every listener; recording stops
    void removeAll();

    void notifyAll(const EventRecord& record);

    size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::vector<ListenerPtr> listeners_;
    ActivationController& activation_;
};

} // namespace evhistory::domain
