#pragma once

#include "TuningState.hpp"
#include "UploadScheduler.hpp"
#include "../IClock.hpp"
#include "../ports/IEventStore.hpp"
#include "../ports/IEventTransport.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace uplink::domain {

enum class UploadState {
    Idle,
    Selecting,
    Sending,
    Succeeded,
    Failed,
    Rescheduled,
    Done
};

struct UploadResult {
    bool attempted = false;        // false when the store was empty
    bool success = false;
    std::size_t batchSize = 0;
    bool rescheduled = false;
};

class UploadCoordinator {
public:
    UploadCoordinator(std::shared_ptr<ports::IEventStore> store,
                      std::shared_ptr<ports::IEventTransport> transport,
                      std::shared_ptr<TuningStateRepository> tuning,
                      std::shared_ptr<UploadScheduler> scheduler,
                      std::shared_ptr<IClock> clock,
                      bool verbose = false);
    
    // One complete upload attempt; never throws on storage or transport errors
    UploadResult runCycle();
    
    UploadState getCurrentState() const { return currentState_; }
    
    // maxBatchSize / average event size, at least 1
    static int approximateBatchCount(int64_t maxBatchSize, int64_t totalSizeBytes, int eventCount);

private:
    void transitionTo(UploadState newState);
    void recordFailure();
    void recordSuccess();
    void applyTuning(const ports::UploadResponse& response);
    
    std::shared_ptr<ports::IEventStore> store_;
    std::shared_ptr<ports::IEventTransport> transport_;
    std::shared_ptr<TuningStateRepository> tuning_;
    std::shared_ptr<UploadScheduler> scheduler_;
    std::shared_ptr<IClock> clock_;
    bool verbose_;
    
    UploadState currentState_ = UploadState::Idle;
};

std::string uploadStateToString(UploadState state);

} // namespace uplink::domain
