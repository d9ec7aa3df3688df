#pragma once

#include "../EventRecord.hpp"

namespace evhistory::ports {

/**
 * @brief Observer of newly recorded events
 *
 * eventOccurred() runs on the recording thread while the listener registry
 * is locked. Implementations must return promptly and must not add or
 * remove listeners from inside the callback.
 *
 * With several producers delivering at once, records may arrive out of
 * occurredAt() order; only the history itself is kept in that order.
 */
class IHistoryListener {
public:
    virtual ~IHistoryListener() = default;

    virtual void eventOccurred(const EventRecord& record) = 0;
};

} // namespace evhistory::ports
