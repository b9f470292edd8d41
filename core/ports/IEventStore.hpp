#pragma once

#include "../Event.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uplink::ports {

struct BatchEntry {
    std::string id;
    std::string data;
};

using Batch = std::vector<BatchEntry>;

class IEventStore {
public:
    virtual ~IEventStore() = default;
    
    // Returns the stored count after the insert, or a non-positive value on failure
    virtual int insert(const Event& event) = 0;
    
    virtual int64_t totalSizeBytes() const = 0;
    virtual int count() const = 0;
    
    virtual std::optional<std::string> oldestSessionId() const = 0;
    virtual bool deleteSession(const std::string& sessionId) = 0;
    
    // Oldest first, does not remove anything
    virtual Batch selectBatch(int approxCount) const = 0;
    
    virtual bool deleteEvents(const std::vector<std::string>& ids) = 0;
    virtual bool deleteAll() = 0;
};

} // namespace uplink::ports
