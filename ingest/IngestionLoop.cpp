#include "ingest/IngestionLoop.hpp"
#include "core/Logger.hpp"

namespace ward {

IngestionLoop::IngestionLoop(const IngestionConfig& config,
                             EventSource& source,
                             const EventNormalizer& normalizer,
                             ProcessBehaviorStore& store,
                             const HeuristicEngine& heuristics,
                             BehaviorSweeper* sweeper)
    : config_(config),
      source_(source),
      normalizer_(normalizer),
      store_(store),
      heuristics_(heuristics),
      sweeper_(sweeper) {}

IngestionLoop::~IngestionLoop() {
    Stop();
}

void IngestionLoop::Start() {
    if (running_.exchange(true)) {
        LOG_WARN("IngestionLoop already running");
        return;
    }
    finished_ = false;
    thread_ = std::thread(&IngestionLoop::Run, this);
    LOG_INFO("IngestionLoop started (batch size {}, poll timeout {} ms)",
             config_.batch_size, config_.poll_timeout.count());
}

void IngestionLoop::Stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wait_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("IngestionLoop stopped");
}

size_t IngestionLoop::PollOnce() {
    std::vector<RawEvent> batch = source_.ReadBatch(config_.batch_size, config_.poll_timeout);
    if (batch.empty()) {
        return 0;
    }
    batches_++;
    return ProcessBatch(batch, Clock::now());
}

size_t IngestionLoop::ProcessBatch(const std::vector<RawEvent>& batch, TimePoint now) {
    size_t recorded = 0;

    for (const auto& raw : batch) {
        raw_events_++;

        std::optional<BehaviorEvent> event = normalizer_.Normalize(raw, now);
        if (!event) {
            continue;
        }

        if (store_.RecordEvent(*event) == RecordOutcome::DISCARDED) {
            discarded_++;
            continue;
        }
        recorded_++;
        recorded++;

        HeuristicResult result = heuristics_.Evaluate(*event);
        if (!result.Empty() || result.ai_communication) {
            indicator_hits_ += result.hits.size();
            store_.ApplyIndicators(event->pid, result.hits, result.ai_communication);
        }

        if (result.immediate) {
            immediate_requests_++;
            if (sweeper_) {
                sweeper_->RequestImmediate(event->pid);
            }
        }
    }
    return recorded;
}

void IngestionLoop::Backoff() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, config_.retry_delay, [this] { return !running_; });
}

void IngestionLoop::Run() {
    while (running_) {
        try {
            PollOnce();

            if (source_.Exhausted()) {
                finished_ = true;
                LOG_INFO("Event source exhausted, ingestion idle");
                break;
            }
        } catch (const SourceUnavailable& e) {
            source_errors_++;
            LOG_WARN("Event source unavailable: {}. Retrying in {} ms", e.what(), config_.retry_delay.count());
            Backoff();
        } catch (const std::exception& e) {
            source_errors_++;
            LOG_ERROR("Ingestion batch failed: {}", e.what());
            Backoff();
        }
    }
}

IngestionStats IngestionLoop::GetStats() const {
    IngestionStats stats;
    stats.batches = batches_.load();
    stats.raw_events = raw_events_.load();
    stats.recorded = recorded_.load();
    stats.discarded = discarded_.load();
    stats.indicator_hits = indicator_hits_.load();
    stats.immediate_requests = immediate_requests_.load();
    stats.source_errors = source_errors_.load();
    return stats;
}

} // namespace ward
