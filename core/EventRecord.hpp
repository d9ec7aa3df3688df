#pragma once

#include "Event.hpp"
#include "EventType.hpp"
#include <cstdint>
#include <string>

namespace evhistory {

/**
 * @brief One recorded event, as kept in the history
 *
 * Built once by the recording path and never modified afterwards. Only
 * accessors are exposed so the value stays immutable after capture.
 */
class EventRecord {
public:
    EventRecord(TypeHandle eventType, std::string renderedForm, uint64_t occurredAt,
                std::string timestamp = {}, std::string source = {});

    /**
     * @brief Capture an upstream event
     * @param event Event as delivered by the dispatcher
     * @param occurredAt Arrival position among recorded events
     * @param timestamp ISO-8601 capture time
     */
    static EventRecord capture(const Event& event, uint64_t occurredAt, std::string timestamp);

    const TypeHandle& eventType() const { return eventType_; }
    const std::string& renderedForm() const { return renderedForm_; }
    uint64_t occurredAt() const { return occurredAt_; }
    const std::string& timestamp() const { return timestamp_; }
    const std::string& source() const { return source_; }

    bool operator==(const EventRecord& other) const;
    bool operator!=(const EventRecord& other) const { return !(*this == other); }

private:
    TypeHandle eventType_;
    std::string renderedForm_;
    uint64_t occurredAt_;
    std::string timestamp_;
    std::string source_;
};

} // namespace evhistory
