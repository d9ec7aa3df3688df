#pragma once

#include "Event.hpp"
#include "EventRecord.hpp"
#include "EventType.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace evhistory {

class JsonCodec {
public:
    static std::string serialize(const Event& event);

    /**
     * Decodes {"type", "parent"?, "source"?, "message"?, "extras"?}.
     * Unknown types are declared in @p registry, under "parent" when given
     * and under the root otherwise.
     */
    static Event deserialize(const std::string& json, TypeRegistry& registry);

    static nlohmann::json eventToJson(const Event& event);
    static Event jsonToEvent(const nlohmann::json& json, TypeRegistry& registry);

    static nlohmann::json recordToJson(const EventRecord& record);
    static nlohmann::json recordsToJson(const std::vector<EventRecord>& records);
};

} // namespace evhistory
