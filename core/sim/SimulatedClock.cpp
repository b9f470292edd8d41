#include "SimulatedClock.hpp"

namespace uplink::sim {

SimulatedClock::SimulatedClock(int64_t startEpochMillis)
    : simulatedTime_(fromEpochMillis(startEpochMillis)) {
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return simulatedTime_;
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ += duration;
}

void SimulatedClock::setEpochMillis(int64_t epochMillis) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = fromEpochMillis(epochMillis);
}

} // namespace uplink::sim
