#pragma once

#include "../Event.hpp"
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>

namespace uplink::domain {

enum class CommandType {
    AddEvent,
    Upload,
    DeleteAll,
    ReportStatus,
    Resume
};

struct Command {
    CommandType type;
    Event event;    // only meaningful for AddEvent
};

// FIFO fed from any thread, drained by exactly one consumer at a time
class CommandQueue {
public:
    using Handler = std::function<void(const Command&)>;
    
    explicit CommandQueue(Handler handler);
    ~CommandQueue();
    
    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;
    
    void post(Command command);
    
    void startWorker();
    // Drains what is already queued, then joins the worker
    void stopWorker();
    bool isWorkerRunning() const;
    
    // Runs queued commands on the calling thread; does nothing while the worker runs
    std::size_t processPending();
    
    // Blocks until every command posted before this call has been handled
    void flush();
    
    std::size_t size() const;

private:
    struct Item {
        std::optional<Command> command;                 // empty for a flush barrier
        std::shared_ptr<std::promise<void>> barrier;
    };
    
    void workerLoop();
    void dispatch(Item& item);
    
    Handler handler_;
    
    std::queue<Item> queue_;
    mutable std::mutex queueMutex_;
    std::condition_variable queueCondition_;
    
    std::thread worker_;
    bool workerRunning_ = false;
    bool stopping_ = false;
    bool processing_ = false;
};

} // namespace uplink::domain
