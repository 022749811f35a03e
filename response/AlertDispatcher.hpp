#pragma once

#include "core/ThreadPool.hpp"
#include "response/AlertChannel.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace ward {

// Delivers alert payloads off the caller's thread. Each payload gets one retry;
// payloads that do not fit in the queue are dropped and counted.
class AlertDispatcher {
public:
    AlertDispatcher(std::shared_ptr<AlertChannel> channel, size_t max_queue = 256);
    ~AlertDispatcher();

    AlertDispatcher(const AlertDispatcher&) = delete;
    AlertDispatcher& operator=(const AlertDispatcher&) = delete;

    // Returns false when the payload could not be queued.
    bool Dispatch(std::string payload);

    // Blocks until every queued payload has been attempted.
    void Flush();
    void Shutdown();

    uint64_t GetSuccessCount() const { return successes_.load(); }
    uint64_t GetFailureCount() const { return failures_.load(); }
    uint64_t GetDroppedCount() const { return pool_.GetRejectedCount(); }

    static constexpr int MAX_ATTEMPTS = 2;

private:
    void Deliver(const std::string& payload);

    std::shared_ptr<AlertChannel> channel_;
    ThreadPool pool_;

    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace ward
