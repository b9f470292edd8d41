#pragma once

#include "../ports/IWakeupTimer.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

namespace uplink::sim {

// Records every arm; fires only when the test says so
class ManualWakeupTimer : public ports::IWakeupTimer {
public:
    ManualWakeupTimer() = default;
    ~ManualWakeupTimer() override = default;

    void armWakeup(std::chrono::system_clock::time_point at) override;
    bool hasPendingWakeup() const override;
    void cancel() override;

    void setWakeupHandler(WakeupHandler handler) override;

    // Clears the pending wakeup and runs the handler; false if nothing was pending
    bool fire();

    std::optional<std::chrono::system_clock::time_point> pendingWakeup() const;
    std::size_t armCount() const;
    std::vector<std::chrono::system_clock::time_point> armedTimes() const;

private:
    mutable std::mutex mutex_;
    std::optional<std::chrono::system_clock::time_point> pending_;
    std::vector<std::chrono::system_clock::time_point> armed_;
    WakeupHandler handler_;
};

} // namespace uplink::sim
