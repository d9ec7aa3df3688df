#pragma once

#include "EventType.hpp"
#include <string>
#include <unordered_map>

namespace evhistory {

struct Event {
    TypeHandle type;
    std::string source;
    std::string message;

    std::unordered_map<std::string, std::string> extras;

    // Summary captured into the history when the event is recorded
    std::string describe() const;
};

Event makeEvent(const TypeHandle& type, const std::string& message = {},
                const std::string& source = {});

} // namespace evhistory
