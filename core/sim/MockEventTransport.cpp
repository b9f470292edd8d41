#include "MockEventTransport.hpp"

namespace uplink::sim {

std::optional<ports::UploadResponse> MockEventTransport::send(const std::vector<std::string>& payloads) {
    std::lock_guard<std::mutex> lock(mutex_);
    sentBatches_.push_back(payloads);

    if (scripted_.empty()) {
        return defaultResponse_;
    }

    auto result = scripted_.front();
    scripted_.pop_front();
    return result;
}

void MockEventTransport::queueResponse(ports::UploadResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripted_.push_back(std::move(response));
}

void MockEventTransport::queueStatus(int statusCode) {
    ports::UploadResponse response;
    response.statusCode = statusCode;
    queueResponse(response);
}

void MockEventTransport::queueFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    scripted_.push_back(std::nullopt);
}

void MockEventTransport::setDefaultResponse(std::optional<ports::UploadResponse> response) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaultResponse_ = std::move(response);
}

std::size_t MockEventTransport::sendCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sentBatches_.size();
}

std::vector<std::vector<std::string>> MockEventTransport::sentBatches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sentBatches_;
}

} // namespace uplink::sim
