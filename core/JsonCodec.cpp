#include "JsonCodec.hpp"

namespace evhistory {

std::string JsonCodec::serialize(const Event& event) {
    return eventToJson(event).dump();
}

Event JsonCodec::deserialize(const std::string& json, TypeRegistry& registry) {
    return jsonToEvent(nlohmann::json::parse(json), registry);
}

nlohmann::json JsonCodec::eventToJson(const Event& event) {
    nlohmann::json j;

    j["type"] = event.type.name();
    auto parent = event.type.parent();
    if (parent.valid()) {
        j["parent"] = parent.name();
    }
    if (!event.source.empty()) {
        j["source"] = event.source;
    }
    if (!event.message.empty()) {
        j["message"] = event.message;
    }

    if (!event.extras.empty()) {
        nlohmann::json extras;
        for (const auto& [key, value] : event.extras) {
            extras[key] = value;
        }
        j["extras"] = extras;
    }

    return j;
}

Event JsonCodec::jsonToEvent(const nlohmann::json& json, TypeRegistry& registry) {
    Event event;

    const auto typeName = json.at("type").get<std::string>();
    const auto parentName = json.value("parent", std::string());

    if (auto known = registry.find(typeName)) {
        event.type = *known;
    } else if (!parentName.empty()) {
        event.type = registry.declare(typeName, parentName);
    } else {
        event.type = registry.declare(typeName);
    }

    event.source = json.value("source", "");
    event.message = json.value("message", "");

    if (json.contains("extras") && json["extras"].is_object()) {
        for (const auto& [key, value] : json["extras"].items()) {
            if (value.is_null()) {
                event.extras[key] = "";
            } else if (value.is_string()) {
                event.extras[key] = value.get<std::string>();
            } else {
                event.extras[key] = value.dump();
            }
        }
    }

    return event;
}

nlohmann::json JsonCodec::recordToJson(const EventRecord& record) {
    nlohmann::json j;
    j["seq"] = record.occurredAt();
    j["ts"] = record.timestamp();
    j["type"] = record.eventType().name();
    if (!record.source().empty()) {
        j["source"] = record.source();
    }
    j["summary"] = record.renderedForm();
    return j;
}

nlohmann::json JsonCodec::recordsToJson(const std::vector<EventRecord>& records) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& record : records) {
        j.push_back(recordToJson(record));
    }
    return j;
}

} // namespace evhistory
