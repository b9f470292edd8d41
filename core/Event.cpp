#include "Event.hpp"

namespace uplink {

const char* const kLocationEventType = "location";
const char* const kRegionEventType = "region_event";

EventClass classifyEventType(const std::string& type) {
    if (type == kRegionEventType) {
        return EventClass::Region;
    }
    if (type == kLocationEventType) {
        return EventClass::Location;
    }
    return EventClass::Normal;
}

std::string eventClassToString(EventClass eventClass) {
    switch (eventClass) {
        case EventClass::Location:
            return "location";
        case EventClass::Region:
            return "region";
        case EventClass::Normal:
        default:
            return "normal";
    }
}

} // namespace uplink
