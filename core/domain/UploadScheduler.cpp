#include "UploadScheduler.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace uplink::domain {

namespace {

int64_t saturatingAdd(int64_t a, int64_t b) {
    if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) {
        return std::numeric_limits<int64_t>::max();
    }
    if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) {
        return std::numeric_limits<int64_t>::min();
    }
    return a + b;
}

} // namespace

UploadScheduler::UploadScheduler(std::shared_ptr<TuningStateRepository> tuning,
                                 std::shared_ptr<ports::IWakeupTimer> timer,
                                 std::shared_ptr<IClock> clock,
                                 std::chrono::milliseconds backgroundReportingInterval,
                                 bool verbose)
    : tuning_(std::move(tuning)), timer_(std::move(timer)), clock_(std::move(clock)),
      backgroundReportingInterval_(backgroundReportingInterval), verbose_(verbose) {
    if (!tuning_ || !timer_ || !clock_) {
        throw std::invalid_argument("UploadScheduler: collaborators cannot be null");
    }
}

int64_t UploadScheduler::nextSendDelay() const {
    const auto& state = tuning_->state();
    int64_t nextSendTime = saturatingAdd(saturatingAdd(state.lastSendTime, state.minBatchInterval),
                                         state.backoffMs);
    return std::max<int64_t>(nextSendTime - clock_->epochMillis(), 0);
}

int64_t UploadScheduler::delayForEvent(EventClass eventClass, bool appInForeground) const {
    switch (eventClass) {
        case EventClass::Region:
            return kRegionBatchDelayMs;
            
        case EventClass::Location:
            if (!appInForeground) {
                int64_t sendDelta = clock_->epochMillis() - tuning_->state().lastSendTime;
                int64_t minimumWait = backgroundReportingInterval_.count() - sendDelta;
                
                if (minimumWait > nextSendDelay() && minimumWait > kBatchDelayMs) {
                    std::cout << "[Scheduler] Location event stored, upload held back for "
                              << minimumWait << " ms" << std::endl;
                    return minimumWait;
                }
            }
            break;
            
        case EventClass::Normal:
            break;
    }
    
    return std::max(nextSendDelay(), kBatchDelayMs);
}

void UploadScheduler::scheduleForEvent(EventClass eventClass, bool appInForeground) {
    int64_t delay = delayForEvent(eventClass, appInForeground);
    if (verbose_) {
        std::cout << "[Scheduler] " << eventClassToString(eventClass) << " event, delay "
                  << delay << " ms" << std::endl;
    }
    schedule(delay);
}

bool UploadScheduler::schedule(int64_t delayMs) {
    const int64_t now = clock_->epochMillis();
    const int64_t sendTime = now + std::clamp<int64_t>(delayMs, 0, kMaxScheduleDelayMs);
    const int64_t previous = tuning_->state().scheduledSendTime;
    
    // Only the earliest deadline wins; stale or missing wakeups are always re-armed
    bool reschedule = previous < now || previous > sendTime;
    
    if (!reschedule && timer_->hasPendingWakeup()) {
        if (verbose_) {
            std::cout << "[Scheduler] Wakeup already scheduled for an earlier time ("
                      << previous << ")" << std::endl;
        }
        return false;
    }
    
    timer_->armWakeup(fromEpochMillis(sendTime));
    
    if (!tuning_->update([sendTime](TuningState& state) { state.scheduledSendTime = sendTime; })) {
        std::cerr << "[Scheduler] Failed to persist scheduled send time" << std::endl;
    }
    
    if (verbose_) {
        std::cout << "[Scheduler] Upload scheduled in " << (sendTime - now) << " ms" << std::endl;
    }
    return true;
}

} // namespace uplink::domain
