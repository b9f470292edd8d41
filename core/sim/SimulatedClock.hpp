#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>

namespace uplink::sim {

// Frozen clock that only moves when told to
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(int64_t startEpochMillis = 1445522400000);
    ~SimulatedClock() override = default;

    std::chrono::system_clock::time_point now() const override;

    void advance(std::chrono::milliseconds duration);
    void setEpochMillis(int64_t epochMillis);

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point simulatedTime_;
};

} // namespace uplink::sim
