#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uplink::ports {

struct UploadResponse {
    int statusCode = 0;
    
    // Tuning values are only present when the collector sends them
    std::optional<int64_t> maxTotalSize;
    std::optional<int64_t> maxBatchSize;
    std::optional<int64_t> maxWait;
    std::optional<int64_t> minBatchInterval;
    
    bool isSuccess() const { return statusCode == 200; }
    
    bool hasTuning() const {
        return maxTotalSize || maxBatchSize || maxWait || minBatchInterval;
    }
};

class IEventTransport {
public:
    virtual ~IEventTransport() = default;
    
    // An empty result means the batch never reached the collector (network error or timeout)
    virtual std::optional<UploadResponse> send(const std::vector<std::string>& payloads) = 0;
};

} // namespace uplink::ports
