#pragma once

#include "Event.hpp"
#include "domain/TuningState.hpp"
#include "ports/IEventTransport.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace uplink {

class JsonCodec {
public:
    // Batch body: JSON array, payloads that are valid JSON are embedded as-is
    static std::string encodeBatch(const std::vector<std::string>& payloads);
    
    // Tuning values are read from the body when present; a bad body leaves them empty
    static ports::UploadResponse decodeResponse(int statusCode, const std::string& body);
    
    static std::string encodeTuningState(const domain::TuningState& state);
    static std::optional<domain::TuningState> decodeTuningState(const std::string& json,
                                                                const domain::TuningState& defaults);
    
    static std::optional<Event> jsonToEvent(const nlohmann::json& json);
    
    // One import line: {"type","id","data","ts","session"}
    static std::optional<Event> parseEventLine(const std::string& line);
    
private:
    static std::optional<int64_t> optionalInteger(const nlohmann::json& json, const char* key);
};

} // namespace uplink
