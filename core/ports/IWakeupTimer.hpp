#pragma once

#include <chrono>
#include <functional>

namespace uplink::ports {

class IWakeupTimer {
public:
    virtual ~IWakeupTimer() = default;
    
    using WakeupHandler = std::function<void()>;
    
    // Replaces any pending wakeup; at most one is ever pending
    virtual void armWakeup(std::chrono::system_clock::time_point at) = 0;
    virtual bool hasPendingWakeup() const = 0;
    virtual void cancel() = 0;
    
    // Once this returns, the previous handler is no longer running
    virtual void setWakeupHandler(WakeupHandler handler) = 0;
};

} // namespace uplink::ports
