#pragma once

#include "core/Config.hpp"
#include "engine/BehaviorTypes.hpp"
#include "engine/Classifier.hpp"
#include "engine/DetectionHandler.hpp"
#include "engine/FusionEngine.hpp"
#include "engine/HeuristicEngine.hpp"
#include "engine/ProcessBehaviorStore.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_set>

namespace ward {

enum class AnalysisTrigger {
    PERIODIC,
    IMMEDIATE
};

inline std::string AnalysisTriggerToString(AnalysisTrigger trigger) {
    switch (trigger) {
        case AnalysisTrigger::PERIODIC:  return "PERIODIC";
        case AnalysisTrigger::IMMEDIATE: return "IMMEDIATE";
    }
    return "UNKNOWN";
}

struct SweeperStats {
    uint64_t analyses{0};
    uint64_t positives{0};
    uint64_t clears{0};
    uint64_t immediate_requests{0};
    uint64_t evicted_stale{0};
    uint64_t evicted_positive{0};
    uint64_t analysis_errors{0};
    uint64_t stale_verdicts{0};
};

// Turns accumulated behavior into verdicts. Owns two threads: the sweeper
// (periodic passes plus the immediate-analysis queue) and maintenance
// (staleness and grace-period eviction). The pass methods are public so they
// can also be driven inline.
class BehaviorSweeper {
public:
    BehaviorSweeper(const SchedulerConfig& config,
                    ProcessBehaviorStore& store,
                    const HeuristicEngine& heuristics,
                    Classifier& classifier,
                    const FusionEngine& fusion,
                    DetectionHandler* handler,
                    ProcessBehaviorStore::ExistsFn exists_fn);
    ~BehaviorSweeper();

    BehaviorSweeper(const BehaviorSweeper&) = delete;
    BehaviorSweeper& operator=(const BehaviorSweeper&) = delete;

    void Start();
    // Lets the current pass finish, then joins both threads.
    void Stop();
    bool IsRunning() const { return running_.load(); }

    // Non-blocking apart from a short queue lock. Duplicate pending requests collapse.
    void RequestImmediate(uint32_t pid);
    size_t PendingImmediate() const;

    // Each returns the number of processes it acted on.
    size_t RunSweepPass(TimePoint now);
    size_t DrainImmediate(TimePoint now);
    size_t RunMaintenancePass(TimePoint now);

    // nullopt when the pid is unknown, already positive, lacks evidence, or was
    // taken over by a new process before a malicious verdict could be applied.
    std::optional<Verdict> AnalyzeProcess(uint32_t pid, AnalysisTrigger trigger, TimePoint now);

    SweeperStats GetStats() const;

private:
    void SweepLoop();
    void MaintenanceLoop();

    SchedulerConfig config_;
    ProcessBehaviorStore& store_;
    const HeuristicEngine& heuristics_;
    Classifier& classifier_;
    const FusionEngine& fusion_;
    DetectionHandler* handler_;
    ProcessBehaviorStore::ExistsFn exists_fn_;

    // Classifier implementations are not required to be thread-safe.
    std::mutex analysis_mutex_;

    mutable std::mutex queue_mutex_;
    std::condition_variable sweep_cv_;
    std::deque<uint32_t> immediate_queue_;
    std::unordered_set<uint32_t> immediate_pending_;

    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;

    std::atomic<bool> running_{false};
    std::thread sweep_thread_;
    std::thread maintenance_thread_;

    std::atomic<uint64_t> analyses_{0};
    std::atomic<uint64_t> positives_{0};
    std::atomic<uint64_t> clears_{0};
    std::atomic<uint64_t> immediate_requests_{0};
    std::atomic<uint64_t> evicted_stale_{0};
    std::atomic<uint64_t> evicted_positive_{0};
    std::atomic<uint64_t> analysis_errors_{0};
    std::atomic<uint64_t> stale_verdicts_{0};
};

} // namespace ward
