#include "Event.hpp"
#include <map>
#include <sstream>

namespace evhistory {

std::string Event::describe() const {
    std::ostringstream ss;
    ss << (message.empty() ? type.name() : message);

    if (!extras.empty()) {
        // Sorted so that the same event always renders the same way
        std::map<std::string, std::string> sorted(extras.begin(), extras.end());
        ss << " {";
        bool first = true;
        for (const auto& [key, value] : sorted) {
            if (!first) ss << ", ";
            ss << key << '=' << value;
            first = false;
        }
        ss << '}';
    }
    return ss.str();
}

Event makeEvent(const TypeHandle& type, const std::string& message, const std::string& source) {
    Event event;
    event.type = type;
    event.message = message;
    event.source = source;
    return event;
}

} // namespace evhistory
