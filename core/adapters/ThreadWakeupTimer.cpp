#include "ThreadWakeupTimer.hpp"
#include <iostream>

namespace uplink::adapters {

ThreadWakeupTimer::ThreadWakeupTimer() {
    thread_ = std::thread([this]() { run(); });
}

ThreadWakeupTimer::~ThreadWakeupTimer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    condition_.notify_all();
    
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ThreadWakeupTimer::armWakeup(std::chrono::system_clock::time_point at) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_ = at;
    }
    condition_.notify_all();
}

bool ThreadWakeupTimer::hasPendingWakeup() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_.has_value();
}

void ThreadWakeupTimer::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_.reset();
    }
    condition_.notify_all();
}

void ThreadWakeupTimer::setWakeupHandler(WakeupHandler handler) {
    std::unique_lock<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
    
    // Wait out a handler already running on the timer thread
    if (std::this_thread::get_id() != thread_.get_id()) {
        condition_.wait(lock, [this]() { return !firing_; });
    }
}

void ThreadWakeupTimer::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    
    while (!shutdown_) {
        if (!deadline_) {
            condition_.wait(lock, [this]() { return shutdown_ || deadline_.has_value(); });
            continue;
        }
        
        auto deadline = *deadline_;
        // Wakes early when re-armed or cancelled; the loop re-reads the deadline
        if (condition_.wait_until(lock, deadline, [this, deadline]() {
                return shutdown_ || !deadline_ || *deadline_ != deadline;
            })) {
            continue;
        }
        
        deadline_.reset();
        WakeupHandler handler = handler_;
        firing_ = true;
        
        lock.unlock();
        if (handler) {
            try {
                handler();
            } catch (const std::exception& e) {
                std::cerr << "[Timer] Wakeup handler failed: " << e.what() << std::endl;
            }
        }
        handler = nullptr;
        lock.lock();
        
        firing_ = false;
        condition_.notify_all();
    }
}

} // namespace uplink::adapters
