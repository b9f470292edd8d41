#pragma once

#include <string>

namespace uplink {

enum class EventClass {
    Normal,
    Location,
    Region
};

struct Event {
    std::string id;
    std::string type;
    std::string data;
    std::string timestamp;
    std::string sessionId;

    // Session id is optional; everything else must be present to be stored
    bool isComplete() const {
        return !id.empty() && !type.empty() && !data.empty() && !timestamp.empty();
    }

    std::size_t serializedSize() const {
        return id.size() + type.size() + data.size() + timestamp.size() + sessionId.size();
    }
};

extern const char* const kLocationEventType;
extern const char* const kRegionEventType;

EventClass classifyEventType(const std::string& type);
std::string eventClassToString(EventClass eventClass);

} // namespace uplink
