#include "JsonCodec.hpp"

namespace uplink {

std::string JsonCodec::encodeBatch(const std::vector<std::string>& payloads) {
    nlohmann::json batch = nlohmann::json::array();
    
    for (const auto& payload : payloads) {
        auto parsed = nlohmann::json::parse(payload, nullptr, false);
        if (parsed.is_discarded()) {
            batch.push_back(payload);
        } else {
            batch.push_back(std::move(parsed));
        }
    }
    
    return batch.dump();
}

ports::UploadResponse JsonCodec::decodeResponse(int statusCode, const std::string& body) {
    ports::UploadResponse response;
    response.statusCode = statusCode;
    
    if (body.empty()) {
        return response;
    }
    
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return response;
    }
    
    response.maxTotalSize = optionalInteger(json, "maxTotalSize");
    response.maxBatchSize = optionalInteger(json, "maxBatchSize");
    response.maxWait = optionalInteger(json, "maxWait");
    response.minBatchInterval = optionalInteger(json, "minBatchInterval");
    return response;
}

std::string JsonCodec::encodeTuningState(const domain::TuningState& state) {
    nlohmann::json j;
    
    j["lastSendTime"] = state.lastSendTime;
    j["scheduledSendTime"] = state.scheduledSendTime;
    j["backoffMs"] = state.backoffMs;
    
    j["maxTotalDbSize"] = state.maxTotalDbSize;
    j["maxBatchSize"] = state.maxBatchSize;
    j["maxWait"] = state.maxWait;
    j["minBatchInterval"] = state.minBatchInterval;
    
    return j.dump(2);
}

std::optional<domain::TuningState> JsonCodec::decodeTuningState(const std::string& json,
                                                                const domain::TuningState& defaults) {
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    
    domain::TuningState state = defaults;
    try {
        state.lastSendTime = j.value("lastSendTime", defaults.lastSendTime);
        state.scheduledSendTime = j.value("scheduledSendTime", defaults.scheduledSendTime);
        state.backoffMs = j.value("backoffMs", defaults.backoffMs);
        
        state.maxTotalDbSize = j.value("maxTotalDbSize", defaults.maxTotalDbSize);
        state.maxBatchSize = j.value("maxBatchSize", defaults.maxBatchSize);
        state.maxWait = j.value("maxWait", defaults.maxWait);
        state.minBatchInterval = j.value("minBatchInterval", defaults.minBatchInterval);
    } catch (const nlohmann::json::exception&) {
        // A key holding the wrong type makes the whole document suspect
        return std::nullopt;
    }
    
    return state;
}

std::optional<Event> JsonCodec::jsonToEvent(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }
    
    Event event;
    try {
        event.type = json.value("type", "");
        event.id = json.value("id", "");
        event.timestamp = json.value("ts", "");
        event.sessionId = json.value("session", "");
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
    
    if (json.contains("data")) {
        const auto& data = json["data"];
        if (data.is_string()) {
            event.data = data.get<std::string>();
        } else if (!data.is_null()) {
            event.data = data.dump();
        }
    }
    
    return event;
}

std::optional<Event> JsonCodec::parseEventLine(const std::string& line) {
    auto json = nlohmann::json::parse(line, nullptr, false);
    if (json.is_discarded()) {
        return std::nullopt;
    }
    return jsonToEvent(json);
}

std::optional<int64_t> JsonCodec::optionalInteger(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<int64_t>();
}

} // namespace uplink
