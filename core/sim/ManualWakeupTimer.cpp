#include "ManualWakeupTimer.hpp"

namespace uplink::sim {

void ManualWakeupTimer::armWakeup(std::chrono::system_clock::time_point at) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ = at;
    armed_.push_back(at);
}

bool ManualWakeupTimer::hasPendingWakeup() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value();
}

void ManualWakeupTimer::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.reset();
}

void ManualWakeupTimer::setWakeupHandler(WakeupHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

bool ManualWakeupTimer::fire() {
    WakeupHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_) {
            return false;
        }
        pending_.reset();
        handler = handler_;
    }

    if (handler) {
        handler();
    }
    return true;
}

std::optional<std::chrono::system_clock::time_point> ManualWakeupTimer::pendingWakeup() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

std::size_t ManualWakeupTimer::armCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_.size();
}

std::vector<std::chrono::system_clock::time_point> ManualWakeupTimer::armedTimes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}

} // namespace uplink::sim
