#include "EventRecord.hpp"

namespace evhistory {

EventRecord::EventRecord(TypeHandle eventType, std::string renderedForm, uint64_t occurredAt,
                         std::string timestamp, std::string source)
    : eventType_(std::move(eventType)),
      renderedForm_(std::move(renderedForm)),
      occurredAt_(occurredAt),
      timestamp_(std::move(timestamp)),
      source_(std::move(source)) {
}

EventRecord EventRecord::capture(const Event& event, uint64_t occurredAt, std::string timestamp) {
    return EventRecord(event.type, event.describe(), occurredAt, std::move(timestamp), event.source);
}

bool EventRecord::operator==(const EventRecord& other) const {
    return occurredAt_ == other.occurredAt_ &&
           eventType_ == other.eventType_ &&
           renderedForm_ == other.renderedForm_ &&
           timestamp_ == other.timestamp_ &&
           source_ == other.source_;
}

} // namespace evhistory
