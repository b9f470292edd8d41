#pragma once

#include "../ports/IWakeupTimer.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace uplink::adapters {

// Single pending wakeup served by a background thread
class ThreadWakeupTimer : public ports::IWakeupTimer {
public:
    ThreadWakeupTimer();
    ~ThreadWakeupTimer() override;
    
    ThreadWakeupTimer(const ThreadWakeupTimer&) = delete;
    ThreadWakeupTimer& operator=(const ThreadWakeupTimer&) = delete;
    
    void armWakeup(std::chrono::system_clock::time_point at) override;
    bool hasPendingWakeup() const override;
    void cancel() override;
    
    // Blocks until a handler already running on the timer thread has returned
    void setWakeupHandler(WakeupHandler handler) override;

private:
    void run();
    
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::optional<std::chrono::system_clock::time_point> deadline_;
    WakeupHandler handler_;
    bool shutdown_ = false;
    bool firing_ = false;
    
    std::thread thread_;
};

} // namespace uplink::adapters
