#include "CommandQueue.hpp"
#include <iostream>
#include <stdexcept>

namespace uplink::domain {

CommandQueue::CommandQueue(Handler handler) : handler_(std::move(handler)) {
    if (!handler_) {
        throw std::invalid_argument("CommandQueue: handler cannot be empty");
    }
}

CommandQueue::~CommandQueue() {
    stopWorker();
}

void CommandQueue::post(Command command) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.push(Item{std::move(command), nullptr});
    }
    queueCondition_.notify_one();
}

void CommandQueue::startWorker() {
    if (!isWorkerRunning() && worker_.joinable()) {
        worker_.join();
    }
    
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (workerRunning_) return;
    
    stopping_ = false;
    workerRunning_ = true;
    worker_ = std::thread([this]() { workerLoop(); });
}

void CommandQueue::stopWorker() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (workerRunning_) {
            stopping_ = true;
        }
    }
    queueCondition_.notify_all();
    
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool CommandQueue::isWorkerRunning() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return workerRunning_;
}

std::size_t CommandQueue::processPending() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (workerRunning_ || processing_) return 0;  // Prevent recursive processing
        processing_ = true;
    }
    
    std::size_t handled = 0;
    while (true) {
        Item item;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (queue_.empty()) break;
            
            item = std::move(queue_.front());
            queue_.pop();
        }
        
        if (item.command) ++handled;
        dispatch(item);
    }
    
    std::lock_guard<std::mutex> lock(queueMutex_);
    processing_ = false;
    return handled;
}

void CommandQueue::flush() {
    auto barrier = std::make_shared<std::promise<void>>();
    auto done = barrier->get_future();
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!workerRunning_) {
            barrier.reset();
        } else {
            queue_.push(Item{std::nullopt, barrier});
        }
    }
    
    if (!barrier) {
        processPending();
        return;
    }
    queueCondition_.notify_one();
    done.wait();
}

std::size_t CommandQueue::size() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

void CommandQueue::workerLoop() {
    while (true) {
        Item item;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCondition_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            
            if (queue_.empty()) {
                workerRunning_ = false;  // stopping and fully drained
                break;
            }
            
            item = std::move(queue_.front());
            queue_.pop();
        }
        
        dispatch(item);
    }
}

void CommandQueue::dispatch(Item& item) {
    if (item.command) {
        try {
            handler_(*item.command);
        } catch (const std::exception& e) {
            std::cerr << "[CommandQueue] Command failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[CommandQueue] Command failed with a non-standard exception" << std::endl;
        }
    }
    
    if (item.barrier) {
        item.barrier->set_value();
    }
}

} // namespace uplink::domain
