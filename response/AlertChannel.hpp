#pragma once

#include <chrono>
#include <string>

namespace ward {

class AlertChannel {
public:
    virtual ~AlertChannel() = default;

    // Delivers one JSON payload. Returns false on any transport or HTTP failure.
    virtual bool Send(const std::string& payload) = 0;
};

// HTTP POST with Content-Type: application/json via libcurl. 2xx counts as delivered.
class CurlWebhookChannel : public AlertChannel {
public:
    CurlWebhookChannel(std::string endpoint, std::chrono::milliseconds timeout);
    ~CurlWebhookChannel() override;

    CurlWebhookChannel(const CurlWebhookChannel&) = delete;
    CurlWebhookChannel& operator=(const CurlWebhookChannel&) = delete;

    bool Send(const std::string& payload) override;

private:
    std::string endpoint_;
    std::chrono::milliseconds timeout_;
};

} // namespace ward
