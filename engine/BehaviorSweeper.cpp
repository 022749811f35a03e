#include "engine/BehaviorSweeper.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <vector>

namespace ward {

BehaviorSweeper::BehaviorSweeper(const SchedulerConfig& config,
                                 ProcessBehaviorStore& store,
                                 const HeuristicEngine& heuristics,
                                 Classifier& classifier,
                                 const FusionEngine& fusion,
                                 DetectionHandler* handler,
                                 ProcessBehaviorStore::ExistsFn exists_fn)
    : config_(config),
      store_(store),
      heuristics_(heuristics),
      classifier_(classifier),
      fusion_(fusion),
      handler_(handler),
      exists_fn_(std::move(exists_fn)) {}

BehaviorSweeper::~BehaviorSweeper() {
    Stop();
}

void BehaviorSweeper::Start() {
    if (running_.exchange(true)) {
        LOG_WARN("BehaviorSweeper already running");
        return;
    }

    sweep_thread_ = std::thread(&BehaviorSweeper::SweepLoop, this);
    maintenance_thread_ = std::thread(&BehaviorSweeper::MaintenanceLoop, this);

    LOG_INFO("BehaviorSweeper started (sweep every {} ms, maintenance every {} ms, min evidence {})",
             config_.sweep_interval.count(), config_.maintenance_interval.count(),
             config_.min_evidence);
}

void BehaviorSweeper::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    sweep_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
    }
    maintenance_cv_.notify_all();

    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    LOG_INFO("BehaviorSweeper stopped");
}

void BehaviorSweeper::RequestImmediate(uint32_t pid) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!immediate_pending_.insert(pid).second) {
            return;
        }
        immediate_queue_.push_back(pid);
    }
    immediate_requests_++;
    sweep_cv_.notify_one();
}

size_t BehaviorSweeper::PendingImmediate() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return immediate_queue_.size();
}

size_t BehaviorSweeper::DrainImmediate(TimePoint now) {
    std::vector<uint32_t> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        batch.assign(immediate_queue_.begin(), immediate_queue_.end());
        immediate_queue_.clear();
        immediate_pending_.clear();
    }

    size_t analyzed = 0;
    for (uint32_t pid : batch) {
        try {
            if (AnalyzeProcess(pid, AnalysisTrigger::IMMEDIATE, now)) {
                analyzed++;
            }
        } catch (const std::exception& e) {
            analysis_errors_++;
            LOG_ERROR("Immediate analysis of PID {} failed: {}", pid, e.what());
        }
    }
    return analyzed;
}

size_t BehaviorSweeper::RunSweepPass(TimePoint now) {
    std::vector<uint32_t> eligible = store_.EligibleForSweep(std::max<size_t>(config_.min_evidence, 1));

    size_t analyzed = 0;
    for (uint32_t pid : eligible) {
        try {
            if (AnalyzeProcess(pid, AnalysisTrigger::PERIODIC, now)) {
                analyzed++;
            }
        } catch (const std::exception& e) {
            analysis_errors_++;
            LOG_ERROR("Periodic analysis of PID {} failed: {}", pid, e.what());
        }
    }

    if (analyzed > 0) {
        LOG_DEBUG("Sweep pass analyzed {} of {} tracked processes", analyzed, store_.Size());
    }
    return analyzed;
}

size_t BehaviorSweeper::RunMaintenancePass(TimePoint now) {
    size_t evicted = 0;

    for (uint32_t pid : store_.StaleProcesses(now, config_.stale_window, exists_fn_)) {
        if (store_.Evict(pid)) {
            evicted_stale_++;
            evicted++;
            LOG_DEBUG("Evicted stale or exited process {}", pid);
        }
    }

    for (uint32_t pid : store_.PositiveExpired(now, config_.positive_grace)) {
        if (store_.Evict(pid)) {
            evicted_positive_++;
            evicted++;
            LOG_DEBUG("Evicted mitigated process {} after grace period", pid);
        }
    }

    size_t pruned = store_.PruneWhitelistedPids(exists_fn_);
    if (pruned > 0) {
        LOG_DEBUG("Forgot {} exited whitelisted process(es)", pruned);
    }

    if (evicted > 0) {
        LOG_INFO("Maintenance evicted {} process record(s), {} remain", evicted, store_.Size());
    }
    return evicted;
}

std::optional<Verdict> BehaviorSweeper::AnalyzeProcess(uint32_t pid, AnalysisTrigger trigger, TimePoint now) {
    std::lock_guard<std::mutex> lock(analysis_mutex_);

    std::optional<ProcessRecord> snapshot = store_.Snapshot(pid);
    if (!snapshot) {
        return std::nullopt;
    }
    if (snapshot->state == ProcessState::ANALYZED_POSITIVE) {
        return std::nullopt;
    }

    size_t required = trigger == AnalysisTrigger::IMMEDIATE ? 1 : std::max<size_t>(config_.min_evidence, 1);
    if (snapshot->token_buffer.size() < required) {
        return std::nullopt;
    }

    std::vector<std::string> tokens(snapshot->token_buffer.begin(), snapshot->token_buffer.end());

    std::vector<IndicatorHit> sequence_hits = heuristics_.EvaluateSequence(snapshot->token_buffer);
    int heuristic_score = std::clamp(snapshot->suspicion_score + HeuristicEngine::TotalDelta(sequence_hits), 0, 100);

    Classification classification = classifier_.Classify(tokens);

    Verdict verdict = fusion_.Decide(heuristic_score, classification.confidence, classification.label);
    verdict.pid = pid;
    verdict.contributing_tokens = std::move(tokens);

    analyses_++;
    LOG_DEBUG("PID {} {} analysis: label={} confidence={:.3f} heuristic={} fused={:.3f} malicious={}",
              pid, AnalysisTriggerToString(trigger), verdict.classifier_label.value_or("none"),
              verdict.classifier_confidence, verdict.heuristic_score, verdict.fused_confidence,
              verdict.is_malicious);

    const int decay = heuristics_.GetConfig().score_decay;

    if (!verdict.is_malicious) {
        clears_++;
        if (!store_.CompleteAnalysis(*snapshot, false, config_.retain_after_clear, decay, now)) {
            stale_verdicts_++;
            LOG_DEBUG("PID {} was replaced during analysis, clear verdict not applied", pid);
        }
        return verdict;
    }

    if (!store_.CompleteAnalysis(*snapshot, true, config_.retain_after_clear, decay, now)) {
        // The analyzed process is gone; whatever holds the pid now is someone else.
        stale_verdicts_++;
        LOG_WARN("PID {} was replaced during analysis, discarding malicious verdict", pid);
        return std::nullopt;
    }
    positives_++;

    std::vector<std::string> sequence_names;
    for (const auto& hit : sequence_hits) {
        sequence_names.push_back(hit.name);
    }

    if (handler_) {
        try {
            handler_->OnDetection(verdict, *snapshot, sequence_names);
        } catch (const std::exception& e) {
            LOG_ERROR("Detection handler failed for PID {}: {}", pid, e.what());
        }
    }
    return verdict;
}

SweeperStats BehaviorSweeper::GetStats() const {
    SweeperStats stats;
    stats.analyses = analyses_.load();
    stats.positives = positives_.load();
    stats.clears = clears_.load();
    stats.immediate_requests = immediate_requests_.load();
    stats.evicted_stale = evicted_stale_.load();
    stats.evicted_positive = evicted_positive_.load();
    stats.analysis_errors = analysis_errors_.load();
    stats.stale_verdicts = stale_verdicts_.load();
    return stats;
}

void BehaviorSweeper::SweepLoop() {
    auto next_sweep = Clock::now() + config_.sweep_interval;

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            sweep_cv_.wait_until(lock, next_sweep, [this] {
                return !running_ || !immediate_queue_.empty();
            });
        }
        if (!running_) {
            break;
        }

        try {
            DrainImmediate(Clock::now());

            TimePoint now = Clock::now();
            if (now >= next_sweep) {
                RunSweepPass(now);
                next_sweep = Clock::now() + config_.sweep_interval;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Sweep loop iteration failed: {}", e.what());
        }
    }
}

void BehaviorSweeper::MaintenanceLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(maintenance_mutex_);
            maintenance_cv_.wait_for(lock, config_.maintenance_interval, [this] {
                return !running_;
            });
        }
        if (!running_) {
            break;
        }

        try {
            RunMaintenancePass(Clock::now());
        } catch (const std::exception& e) {
            LOG_ERROR("Maintenance pass failed: {}", e.what());
        }
    }
}

} // namespace ward
