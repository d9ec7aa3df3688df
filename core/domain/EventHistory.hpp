#pragma once

#include "../Event.hpp"
#include "../EventRecord.hpp"
#include "../EventType.hpp"
#include "../HistoryConfig.hpp"
#include "../IClock.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/IHistoryListener.hpp"
#include "../ports/IRecordFormatter.hpp"
#include "ActivationController.hpp"
#include "HistoryLog.hpp"
#include "ListenerRegistry.hpp"
#include "QueryEngine.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace evhistory::domain {

/**
 * @brief In-memory history of dispatched events
 *
 * Records incoming events only while active. Registering the first listener
 * turns recording on, removing the last one turns it off, and setActive()
 * overrides either until the next change. Every method may be called from
 * any thread.
 *
 * @note Listeners are called synchronously on the thread delivering the
 *       event and must not add or remove listeners from the callback.
 */
class EventHistory {
public:
    using ListenerPtr = ListenerRegistry::ListenerPtr;

    /**
     * @param clock Source of capture timestamps
     * @param formatter Encoder used by toText()
     * @param config Capacity, initial activation and logging settings
     * @throws std::invalid_argument if clock or formatter is null
     */
    EventHistory(std::shared_ptr<IClock> clock,
                 std::shared_ptr<const ports::IRecordFormatter> formatter,
                 const HistoryConfig& config = HistoryConfig{});
    ~EventHistory();

    EventHistory(const EventHistory&) = delete;
    EventHistory& operator=(const EventHistory&) = delete;

    /**
     * @brief Subscribe to every event of @p rootType and its subtypes on @p bus
     * @post A previous attachment is released first
     */
    void attach(std::shared_ptr<ports::IEventBus> bus, const TypeHandle& rootType);

    /**
     * @brief Detach from the bus and drop all listeners; safe to call twice
     * @post No bus delivery into this recorder is running or will start
     */
    void shutdown();

    /** @brief Upstream delivery; dropped without work while dormant */
    void onEvent(const Event& event);

    void setActive(bool active);
    bool isActive() const;

    void clear();
    size_t size() const;

    std::vector<EventRecord> events() const;
    std::vector<EventRecord> events(const OptionalFilter& includes,
                                    const OptionalFilter& excludes) const;

    std::string toText(const OptionalFilter& filteredOut,
                       const OptionalFilter& highlighted) const;
    std::string toText(const OptionalFilter& filteredOut,
                       const OptionalFilter& highlighted,
                       const ports::IRecordFormatter& formatter) const;

    void addListener(ListenerPtr listener);
    void removeListener(const ListenerPtr& listener);
    size_t listenerCount() const;

    const HistoryLog& log() const { return log_; }

private:
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<const ports::IRecordFormatter> formatter_;
    HistoryConfig config_;

    ActivationController activation_;
    ListenerRegistry listeners_;
    HistoryLog log_;
    QueryEngine queryEngine_;

    // Sequence assignment and append happen together so log order matches occurredAt
    std::mutex recordingMutex_;
    uint64_t nextSequence_ = 0;

    std::mutex attachMutex_;
    std::shared_ptr<ports::IEventBus> bus_;
    std::optional<ports::IEventBus::SubscriptionId> subscription_;
};

} // namespace evhistory::domain
