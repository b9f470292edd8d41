#include "EventService.hpp"
#include <iostream>
#include <stdexcept>

namespace uplink::domain {

EventService::EventService(std::shared_ptr<ports::IEventStore> store,
                           std::shared_ptr<ports::IEventTransport> transport,
                           std::shared_ptr<TuningStateRepository> tuning,
                           std::shared_ptr<ports::IWakeupTimer> timer,
                           std::shared_ptr<IClock> clock,
                           ServiceOptions options)
    : store_(std::move(store)), tuning_(std::move(tuning)), timer_(std::move(timer)),
      clock_(std::move(clock)), options_(options),
      commands_([this](const Command& command) { handleCommand(command); }) {
    
    if (!store_ || !transport || !tuning_ || !timer_ || !clock_) {
        throw std::invalid_argument("EventService: collaborators cannot be null");
    }
    
    scheduler_ = std::make_shared<UploadScheduler>(tuning_, timer_, clock_,
                                                   options_.backgroundReportingInterval,
                                                   options_.verbose);
    coordinator_ = std::make_shared<UploadCoordinator>(store_, std::move(transport), tuning_,
                                                       scheduler_, clock_, options_.verbose);
    
    // A fired wakeup is just another Upload command behind whatever is running
    timer_->setWakeupHandler([this]() { requestUpload(); });
}

EventService::~EventService() {
    timer_->setWakeupHandler(nullptr);
    stop();
}

void EventService::start() {
    commands_.startWorker();
    commands_.post(Command{CommandType::Resume, {}});
}

void EventService::stop() {
    commands_.stopWorker();
    timer_->cancel();
}

void EventService::addEvent(Event event) {
    commands_.post(Command{CommandType::AddEvent, std::move(event)});
}

void EventService::requestUpload() {
    commands_.post(Command{CommandType::Upload, {}});
}

void EventService::deleteAll() {
    commands_.post(Command{CommandType::DeleteAll, {}});
}

void EventService::reportStatus() {
    commands_.post(Command{CommandType::ReportStatus, {}});
}

void EventService::flush() {
    commands_.flush();
}

std::size_t EventService::processPending() {
    return commands_.processPending();
}

void EventService::handleCommand(const Command& command) {
    switch (command.type) {
        case CommandType::AddEvent:
            handleAddEvent(command.event);
            break;
        case CommandType::Upload:
            handleUpload();
            break;
        case CommandType::DeleteAll:
            handleDeleteAll();
            break;
        case CommandType::ReportStatus:
            handleReportStatus();
            break;
        case CommandType::Resume:
            handleResume();
            break;
        default:
            std::cerr << "[EventService] Unrecognized command "
                      << static_cast<int>(command.type) << std::endl;
            break;
    }
}

void EventService::handleAddEvent(const Event& event) {
    if (!event.isComplete()) {
        std::cerr << "[EventService] Unable to add event with missing data (id='"
                  << event.id << "', type='" << event.type << "')" << std::endl;
        return;
    }
    
    enforceSizeLimit(event);
    
    if (store_->insert(event) <= 0) {
        std::cerr << "[EventService] Unable to insert event " << event.id << std::endl;
    }
    
    scheduler_->scheduleForEvent(classifyEventType(event.type), appInForeground_);
}

void EventService::enforceSizeLimit(const Event& incoming) {
    if (store_->count() <= 0) {
        return;
    }
    
    const int64_t projected = store_->totalSizeBytes() + static_cast<int64_t>(incoming.serializedSize());
    if (projected <= tuning_->state().maxTotalDbSize) {
        return;
    }
    
    std::cout << "[EventService] Event store size exceeded, deleting oldest session" << std::endl;
    
    auto oldest = store_->oldestSessionId();
    if (!oldest) {
        std::cerr << "[EventService] Could not determine oldest session" << std::endl;
        return;
    }
    
    if (!store_->deleteSession(*oldest)) {
        std::cerr << "[EventService] Failed to evict session '" << *oldest << "'" << std::endl;
    }
}

void EventService::handleUpload() {
    coordinator_->runCycle();
}

void EventService::handleDeleteAll() {
    std::cout << "[EventService] Deleting all stored events" << std::endl;
    if (!store_->deleteAll()) {
        std::cerr << "[EventService] Failed to delete stored events" << std::endl;
    }
}

void EventService::handleReportStatus() {
    const auto& state = tuning_->state();
    std::cout << "[EventService] " << store_->count() << " events, "
              << store_->totalSizeBytes() << "/" << state.maxTotalDbSize << " bytes, "
              << "backoff " << state.backoffMs << " ms, "
              << "next upload in " << scheduler_->nextSendDelay() << " ms, "
              << (timer_->hasPendingWakeup() ? "wakeup armed" : "no wakeup") << std::endl;
}

void EventService::handleResume() {
    // Stored events from a previous run need a wakeup in this process
    if (store_->count() > 0) {
        scheduler_->schedule(scheduler_->nextSendDelay());
    }
    handleReportStatus();
}

} // namespace uplink::domain
