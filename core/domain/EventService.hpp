/**
 * @file EventService.hpp
 * @brief Telemetry event buffering and upload service
 *
 * Entry point of the upload pipeline. Producers and the wakeup timer post
 * commands (AddEvent, Upload, DeleteAll) from any thread; a single worker
 * drains them in FIFO order so that the event store and the tuning state are
 * only ever touched by one operation at a time.
 *
 * Nothing propagates back to callers: malformed events and storage or
 * transport failures are logged and absorbed. Persistent failures surface
 * only as growing upload latency through the backoff.
 */

#pragma once

#include "CommandQueue.hpp"
#include "TuningState.hpp"
#include "UploadCoordinator.hpp"
#include "UploadScheduler.hpp"
#include "../Event.hpp"
#include "../IClock.hpp"
#include "../ports/IEventStore.hpp"
#include "../ports/IEventTransport.hpp"
#include "../ports/IWakeupTimer.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

namespace uplink::domain {

/**
 * @brief Runtime options for the service
 */
struct ServiceOptions {
    /// Minimum spacing of location uploads while the host app is in the background
    std::chrono::milliseconds backgroundReportingInterval = std::chrono::minutes(15);
    bool verbose = false;  ///< Emit scheduler and state transition traces
};

/**
 * @brief Command-driven event buffer with a single upload worker
 *
 * Owns the UploadScheduler and UploadCoordinator and wires the wakeup timer
 * back into the command queue. Tuning state is expected to be loaded by the
 * caller before start().
 *
 * @note Posting is thread-safe; the handlers run on the worker thread only
 */
class EventService {
public:
    /**
     * @brief Construct the service with its collaborators
     * @param store Durable event store
     * @param transport Collector transport used by upload cycles
     * @param tuning Persisted tuning and pacing state
     * @param timer Wakeup timer; its handler is replaced by the service
     * @param clock Time source for pacing arithmetic
     * @param options Background interval and verbosity
     * @throws std::invalid_argument if any collaborator is null
     */
    EventService(std::shared_ptr<ports::IEventStore> store,
                 std::shared_ptr<ports::IEventTransport> transport,
                 std::shared_ptr<TuningStateRepository> tuning,
                 std::shared_ptr<ports::IWakeupTimer> timer,
                 std::shared_ptr<IClock> clock,
                 ServiceOptions options = {});
    
    ~EventService();
    
    EventService(const EventService&) = delete;
    EventService& operator=(const EventService&) = delete;
    
    /**
     * @brief Start the worker thread
     * @post A wakeup is armed if events survived from a previous run
     * @note Without start() commands only run through processPending() or flush()
     */
    void start();
    
    /**
     * @brief Drain queued commands, stop the worker and cancel the wakeup
     */
    void stop();
    
    /// Queue an event; malformed events are dropped when handled
    void addEvent(Event event);
    
    /// Queue an upload cycle (also what the wakeup timer posts)
    void requestUpload();
    
    /// Queue a full purge of stored events
    void deleteAll();
    
    /// Queue a status line on the log
    void reportStatus();
    
    /**
     * @brief Block until all previously posted commands have been handled
     * @note Without a running worker the commands run on the calling thread
     */
    void flush();
    
    /**
     * @brief Handle queued commands on the calling thread
     * @return Number of commands handled (0 while the worker runs)
     */
    std::size_t processPending();
    
    void setAppInForeground(bool inForeground) { appInForeground_ = inForeground; }
    bool isAppInForeground() const { return appInForeground_; }
    
    std::shared_ptr<UploadScheduler> scheduler() const { return scheduler_; }
    std::shared_ptr<UploadCoordinator> coordinator() const { return coordinator_; }

private:
    void handleCommand(const Command& command);
    void handleAddEvent(const Event& event);
    void handleUpload();
    void handleDeleteAll();
    void handleReportStatus();
    void handleResume();
    
    /// Evict the oldest session if the new event would take the store over its cap
    void enforceSizeLimit(const Event& incoming);
    
    std::shared_ptr<ports::IEventStore> store_;
    std::shared_ptr<TuningStateRepository> tuning_;
    std::shared_ptr<ports::IWakeupTimer> timer_;
    std::shared_ptr<IClock> clock_;
    ServiceOptions options_;
    
    std::shared_ptr<UploadScheduler> scheduler_;
    std::shared_ptr<UploadCoordinator> coordinator_;
    
    std::atomic<bool> appInForeground_{true};
    CommandQueue commands_;
};

} // namespace uplink::domain
