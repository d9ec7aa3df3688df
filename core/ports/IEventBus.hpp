#pragma once

#include "../Event.hpp"
#include "../EventType.hpp"
#include <cstdint>
#include <functional>

namespace evhistory::ports {

class IEventBus {
public:
    virtual ~IEventBus() = default;

    using SubscriptionId = uint64_t;
    using EventHandler = std::function<void(const Event&)>;

    virtual void publish(const Event& event) = 0;

    // Handler receives every event whose type is eventType or a subtype of it
    virtual SubscriptionId subscribe(const TypeHandle& eventType, EventHandler handler) = 0;
    virtual bool unsubscribe(SubscriptionId id) = 0;
    virtual void processEvents() = 0;
};

} // namespace evhistory::ports
