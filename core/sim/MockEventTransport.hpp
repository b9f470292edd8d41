#pragma once

#include "../ports/IEventTransport.hpp"
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace uplink::sim {

class MockEventTransport : public ports::IEventTransport {
public:
    MockEventTransport() = default;
    ~MockEventTransport() override = default;

    std::optional<ports::UploadResponse> send(const std::vector<std::string>& payloads) override;

    // Scripted results are consumed in order; once exhausted the default is returned
    void queueResponse(ports::UploadResponse response);
    void queueStatus(int statusCode);
    void queueFailure();
    void setDefaultResponse(std::optional<ports::UploadResponse> response);

    std::size_t sendCount() const;
    std::vector<std::vector<std::string>> sentBatches() const;

private:
    mutable std::mutex mutex_;
    std::deque<std::optional<ports::UploadResponse>> scripted_;
    std::optional<ports::UploadResponse> defaultResponse_ = ports::UploadResponse{200, {}, {}, {}, {}};
    std::vector<std::vector<std::string>> sentBatches_;
};

} // namespace uplink::sim
