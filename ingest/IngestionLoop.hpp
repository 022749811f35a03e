#pragma once

#include "core/Config.hpp"
#include "engine/BehaviorSweeper.hpp"
#include "engine/HeuristicEngine.hpp"
#include "engine/ProcessBehaviorStore.hpp"
#include "ingest/EventNormalizer.hpp"
#include "ingest/EventSource.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace ward {

struct IngestionStats {
    uint64_t batches{0};
    uint64_t raw_events{0};
    uint64_t recorded{0};
    uint64_t discarded{0};
    uint64_t indicator_hits{0};
    uint64_t immediate_requests{0};
    uint64_t source_errors{0};
};

// Pulls raw batches from an EventSource and feeds them through
// normalize -> record -> per-event heuristics -> immediate requests.
class IngestionLoop {
public:
    // sweeper may be null, in which case immediate requests are only counted.
    IngestionLoop(const IngestionConfig& config,
                  EventSource& source,
                  const EventNormalizer& normalizer,
                  ProcessBehaviorStore& store,
                  const HeuristicEngine& heuristics,
                  BehaviorSweeper* sweeper);
    ~IngestionLoop();

    IngestionLoop(const IngestionLoop&) = delete;
    IngestionLoop& operator=(const IngestionLoop&) = delete;

    void Start();
    // Finishes the batch in progress, then joins.
    void Stop();
    bool IsRunning() const { return running_.load(); }

    // True once a finite source has been fully consumed.
    bool IsFinished() const { return finished_.load(); }

    // One read-and-process step. Returns the number of records recorded.
    // SourceUnavailable propagates to the caller.
    size_t PollOnce();

    size_t ProcessBatch(const std::vector<RawEvent>& batch, TimePoint now);

    IngestionStats GetStats() const;

private:
    void Run();
    void Backoff();

    IngestionConfig config_;
    EventSource& source_;
    const EventNormalizer& normalizer_;
    ProcessBehaviorStore& store_;
    const HeuristicEngine& heuristics_;
    BehaviorSweeper* sweeper_;

    std::atomic<bool> running_{false};
    std::atomic<bool> finished_{false};
    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::atomic<uint64_t> batches_{0};
    std::atomic<uint64_t> raw_events_{0};
    std::atomic<uint64_t> recorded_{0};
    std::atomic<uint64_t> discarded_{0};
    std::atomic<uint64_t> indicator_hits_{0};
    std::atomic<uint64_t> immediate_requests_{0};
    std::atomic<uint64_t> source_errors_{0};
};

} // namespace ward
