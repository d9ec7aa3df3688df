#include "EventHistory.hpp"
#include <iostream>
#include <stdexcept>

namespace evhistory::domain {

EventHistory::EventHistory(std::shared_ptr<IClock> clock,
                           std::shared_ptr<const ports::IRecordFormatter> formatter,
                           const HistoryConfig& config)
    : clock_(std::move(clock)),
      formatter_(std::move(formatter)),
      config_(config),
      activation_(config.verbose),
      listeners_(activation_),
      log_(config.maxEntries),
      queryEngine_(log_) {
    if (!clock_) {
        throw std::invalid_argument("EventHistory requires a clock");
    }
    if (!formatter_) {
        throw std::invalid_argument("EventHistory requires a record formatter");
    }

    if (config_.startActive) {
        activation_.setActive(true);
    }
}

EventHistory::~EventHistory() {
    shutdown();
}

void EventHistory::attach(std::shared_ptr<ports::IEventBus> bus, const TypeHandle& rootType) {
    std::lock_guard<std::mutex> lock(attachMutex_);

    if (bus_ && subscription_) {
        bus_->unsubscribe(*subscription_);
    }

    bus_ = std::move(bus);
    subscription_.reset();
    if (bus_) {
        subscription_ = bus_->subscribe(rootType, [this](const Event& event) {
            onEvent(event);
        });
        if (config_.verbose) {
            std::cout << "[History] Attached to event bus for " << rootType.name() << std::endl;
        }
    }
}

void EventHistory::shutdown() {
    {
        std::lock_guard<std::mutex> lock(attachMutex_);
        if (bus_ && subscription_) {
            bus_->unsubscribe(*subscription_);
            if (config_.verbose) {
                std::cout << "[History] Detached from event bus" << std::endl;
            }
        }
        subscription_.reset();
        bus_.reset();
    }

    listeners_.removeAll();
}

void EventHistory::onEvent(const Event& event) {
    if (!activation_.isActive()) return; // only record events while active

    std::optional<EventRecord> record;
    {
        std::lock_guard<std::mutex> lock(recordingMutex_);
        record.emplace(EventRecord::capture(event, nextSequence_++, clock_->iso8601()));
        log_.append(*record);
    }

    listeners_.notifyAll(*record);
}

void EventHistory::setActive(bool active) {
    activation_.setActive(active);
}

bool EventHistory::isActive() const {
    return activation_.isActive();
}

void EventHistory::clear() {
    log_.clear();
    if (config_.verbose) {
        std::cout << "[History] Cleared" << std::endl;
    }
}

size_t EventHistory::size() const {
    return log_.size();
}

std::vector<EventRecord> EventHistory::events() const {
    return events(std::nullopt, std::nullopt);
}

std::vector<EventRecord> EventHistory::events(const OptionalFilter& includes,
                                              const OptionalFilter& excludes) const {
    return queryEngine_.query(includes, excludes);
}

std::string EventHistory::toText(const OptionalFilter& filteredOut,
                                 const OptionalFilter& highlighted) const {
    return toText(filteredOut, highlighted, *formatter_);
}

std::string EventHistory::toText(const OptionalFilter& filteredOut,
                                 const OptionalFilter& highlighted,
                                 const ports::IRecordFormatter& formatter) const {
    return queryEngine_.render(filteredOut, highlighted, formatter);
}

void EventHistory::addListener(ListenerPtr listener) {
    listeners_.add(std::move(listener));
}

void EventHistory::removeListener(const ListenerPtr& listener) {
    listeners_.remove(listener);
}

size_t EventHistory::listenerCount() const {
    return listeners_.size();
}

} // namespace evhistory::domain
