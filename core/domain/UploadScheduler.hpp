#pragma once

#include "TuningState.hpp"
#include "../Event.hpp"
#include "../IClock.hpp"
#include "../ports/IWakeupTimer.hpp"
#include <chrono>
#include <cstdint>
#include <memory>

namespace uplink::domain {

class UploadScheduler {
public:
    static constexpr int64_t kRegionBatchDelayMs = 1000;
    static constexpr int64_t kBatchDelayMs = 10000;
    // Longest wakeup ever armed; collector tuning can push delays far beyond it
    static constexpr int64_t kMaxScheduleDelayMs = 365LL * 24 * 60 * 60 * 1000;
    
    UploadScheduler(std::shared_ptr<TuningStateRepository> tuning,
                    std::shared_ptr<ports::IWakeupTimer> timer,
                    std::shared_ptr<IClock> clock,
                    std::chrono::milliseconds backgroundReportingInterval,
                    bool verbose = false);
    
    // lastSendTime + minBatchInterval + backoff (saturating), relative to now, never negative
    int64_t nextSendDelay() const;
    
    int64_t delayForEvent(EventClass eventClass, bool appInForeground) const;
    void scheduleForEvent(EventClass eventClass, bool appInForeground);
    
    // Delay is clamped to [0, kMaxScheduleDelayMs]. Returns true when the wakeup was (re)armed
    bool schedule(int64_t delayMs);
    
    std::chrono::milliseconds backgroundReportingInterval() const { return backgroundReportingInterval_; }

private:
    std::shared_ptr<TuningStateRepository> tuning_;
    std::shared_ptr<ports::IWakeupTimer> timer_;
    std::shared_ptr<IClock> clock_;
    std::chrono::milliseconds backgroundReportingInterval_;
    bool verbose_;
};

} // namespace uplink::domain
