#include "response/AlertDispatcher.hpp"
#include "core/Logger.hpp"

namespace ward {

AlertDispatcher::AlertDispatcher(std::shared_ptr<AlertChannel> channel, size_t max_queue)
    : channel_(std::move(channel)), pool_(1, max_queue) {}

AlertDispatcher::~AlertDispatcher() {
    Shutdown();
}

bool AlertDispatcher::Dispatch(std::string payload) {
    if (!channel_) {
        return false;
    }

    bool queued = pool_.TryPost([this, payload = std::move(payload)]() { Deliver(payload); });
    if (!queued) {
        failures_++;
        LOG_WARN("Alert queue full ({} pending) or stopped, alert dropped", pool_.GetQueueSize());
    }
    return queued;
}

void AlertDispatcher::Deliver(const std::string& payload) {
    for (int attempt = 1; attempt <= MAX_ATTEMPTS; ++attempt) {
        bool delivered = false;
        try {
            delivered = channel_->Send(payload);
        } catch (const std::exception& e) {
            LOG_ERROR("Alert channel threw on attempt {}: {}", attempt, e.what());
        }

        if (delivered) {
            successes_++;
            LOG_DEBUG("Alert delivered on attempt {}", attempt);
            return;
        }
    }

    failures_++;
    LOG_ERROR("Alert delivery failed after {} attempts", MAX_ATTEMPTS);
}

void AlertDispatcher::Flush() {
    pool_.WaitIdle();
}

void AlertDispatcher::Shutdown() {
    pool_.Shutdown();
}

} // namespace ward
