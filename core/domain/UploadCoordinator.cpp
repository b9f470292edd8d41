#include "UploadCoordinator.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace uplink::domain {

UploadCoordinator::UploadCoordinator(std::shared_ptr<ports::IEventStore> store,
                                     std::shared_ptr<ports::IEventTransport> transport,
                                     std::shared_ptr<TuningStateRepository> tuning,
                                     std::shared_ptr<UploadScheduler> scheduler,
                                     std::shared_ptr<IClock> clock,
                                     bool verbose)
    : store_(std::move(store)), transport_(std::move(transport)), tuning_(std::move(tuning)),
      scheduler_(std::move(scheduler)), clock_(std::move(clock)), verbose_(verbose) {
    if (!store_ || !transport_ || !tuning_ || !scheduler_ || !clock_) {
        throw std::invalid_argument("UploadCoordinator: collaborators cannot be null");
    }
}

UploadResult UploadCoordinator::runCycle() {
    UploadResult result;
    transitionTo(UploadState::Selecting);
    
    // Advance the pacing baseline before sending so sustained failures cannot spin
    const int64_t now = clock_->epochMillis();
    if (!tuning_->update([now](TuningState& state) { state.lastSendTime = now; })) {
        std::cerr << "[Uploader] Failed to persist last send time" << std::endl;
    }
    
    const int eventCount = store_->count();
    if (eventCount <= 0) {
        std::cout << "[Uploader] No events to send, ending upload" << std::endl;
        transitionTo(UploadState::Done);
        transitionTo(UploadState::Idle);
        return result;
    }
    
    const int batchCount = approximateBatchCount(tuning_->state().maxBatchSize,
                                                 store_->totalSizeBytes(), eventCount);
    ports::Batch batch = store_->selectBatch(batchCount);
    
    std::vector<std::string> payloads;
    std::vector<std::string> ids;
    payloads.reserve(batch.size());
    ids.reserve(batch.size());
    for (auto& entry : batch) {
        ids.push_back(std::move(entry.id));
        payloads.push_back(std::move(entry.data));
    }
    
    result.attempted = true;
    result.batchSize = ids.size();
    
    transitionTo(UploadState::Sending);
    auto response = transport_->send(payloads);
    
    // Anything other than exactly 200 is a failure, including other 2xx codes
    result.success = response && response->isSuccess();
    
    if (result.success) {
        transitionTo(UploadState::Succeeded);
        std::cout << "[Uploader] Uploaded " << ids.size() << " events" << std::endl;
        if (!store_->deleteEvents(ids)) {
            std::cerr << "[Uploader] Failed to delete uploaded events" << std::endl;
        }
        recordSuccess();
    } else {
        transitionTo(UploadState::Failed);
        if (response) {
            std::cerr << "[Uploader] Collector rejected batch with status "
                      << response->statusCode << std::endl;
        } else {
            std::cerr << "[Uploader] Batch send failed" << std::endl;
        }
        recordFailure();
    }
    
    if (!result.success || eventCount - static_cast<int>(ids.size()) > 0) {
        if (verbose_) {
            std::cout << "[Uploader] Scheduling next batch upload" << std::endl;
        }
        scheduler_->schedule(scheduler_->nextSendDelay());
        result.rescheduled = true;
        transitionTo(UploadState::Rescheduled);
    } else {
        transitionTo(UploadState::Done);
    }
    
    if (response) {
        applyTuning(*response);
    }
    
    transitionTo(UploadState::Idle);
    return result;
}

int UploadCoordinator::approximateBatchCount(int64_t maxBatchSize, int64_t totalSizeBytes, int eventCount) {
    if (eventCount <= 0) {
        return 1;
    }
    
    int64_t averageSize = std::max<int64_t>(totalSizeBytes / eventCount, 1);
    int64_t count = maxBatchSize / averageSize;
    return static_cast<int>(std::clamp<int64_t>(count, 1, eventCount));
}

void UploadCoordinator::recordSuccess() {
    if (!tuning_->update([](TuningState& state) { state.backoffMs = 0; })) {
        std::cerr << "[Uploader] Failed to persist backoff reset" << std::endl;
    }
}

void UploadCoordinator::recordFailure() {
    bool persisted = tuning_->update([](TuningState& state) {
        if (state.backoffMs == 0) {
            state.backoffMs = state.minBatchInterval;
        } else {
            // Doubling must not overflow when the collector sends a huge maxWait
            state.backoffMs = state.backoffMs > state.maxWait / 2 ? state.maxWait
                                                                  : state.backoffMs * 2;
        }
    });
    
    if (!persisted) {
        std::cerr << "[Uploader] Failed to persist backoff" << std::endl;
    }
    std::cout << "[Uploader] Will retry in " << tuning_->state().backoffMs << " ms" << std::endl;
}

void UploadCoordinator::applyTuning(const ports::UploadResponse& response) {
    if (!response.hasTuning()) {
        return;
    }
    
    // The collector is the authority for these bounds
    bool persisted = tuning_->update([&response](TuningState& state) {
        if (response.maxTotalSize) state.maxTotalDbSize = *response.maxTotalSize;
        if (response.maxBatchSize) state.maxBatchSize = *response.maxBatchSize;
        if (response.maxWait) state.maxWait = *response.maxWait;
        if (response.minBatchInterval) state.minBatchInterval = *response.minBatchInterval;
    });
    
    if (!persisted) {
        std::cerr << "[Uploader] Failed to persist collector tuning" << std::endl;
    }
}

void UploadCoordinator::transitionTo(UploadState newState) {
    if (currentState_ == newState) return;
    
    if (verbose_) {
        std::cout << "[Uploader] " << uploadStateToString(currentState_) << " -> "
                  << uploadStateToString(newState) << std::endl;
    }
    currentState_ = newState;
}

std::string uploadStateToString(UploadState state) {
    switch (state) {
        case UploadState::Idle: return "Idle";
        case UploadState::Selecting: return "Selecting";
        case UploadState::Sending: return "Sending";
        case UploadState::Succeeded: return "Succeeded";
        case UploadState::Failed: return "Failed";
        case UploadState::Rescheduled: return "Rescheduled";
        case UploadState::Done: return "Done";
        default: return "Unknown";
    }
}

} // namespace uplink::domain
