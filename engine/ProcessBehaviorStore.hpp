#pragma once

#include "core/Config.hpp"
#include "engine/BehaviorTypes.hpp"
#include "engine/TokenDeriver.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ward {

enum class RecordOutcome {
    DISCARDED,
    CREATED,
    APPENDED
};

// Owns every ProcessRecord. Records are spread over lock stripes keyed by pid:
// operations on one pid are serialized, operations on pids in different stripes
// never contend. Callers only ever receive copies.
class ProcessBehaviorStore {
public:
    using ExistsFn = std::function<bool(uint32_t)>;

    ProcessBehaviorStore(const StoreConfig& config, const HeuristicConfig& heuristics);

    ProcessBehaviorStore(const ProcessBehaviorStore&) = delete;
    ProcessBehaviorStore& operator=(const ProcessBehaviorStore&) = delete;

    RecordOutcome RecordEvent(const BehaviorEvent& event);

    // Appends an already-derived token, creating the record when needed.
    RecordOutcome RecordToken(uint32_t pid, const std::string& token, TimePoint now);

    // Both return the clamped score, or nullopt when the pid is not tracked.
    std::optional<int> AdjustScore(uint32_t pid, int delta);
    std::optional<int> ApplyIndicators(uint32_t pid, const std::vector<IndicatorHit>& hits,
                                       bool ai_communication);

    std::optional<ProcessRecord> Snapshot(uint32_t pid) const;
    bool Evict(uint32_t pid);

    // Records whose process is gone (per exists_fn) or idle since before now - window.
    // Positive records are left to PositiveExpired(). exists_fn is invoked without
    // any stripe lock held.
    std::vector<uint32_t> StaleProcesses(TimePoint now, Millis window, const ExistsFn& exists_fn) const;

    // TRACKED records holding at least min_tokens tokens. A cleared record becomes
    // TRACKED again when a new token arrives.
    std::vector<uint32_t> EligibleForSweep(size_t min_tokens) const;

    // Closes the analysis of `analyzed`, a Snapshot() taken before classification.
    // Returns false without touching anything when that record has since been
    // evicted, or replaced by a new process reusing the pid.
    // A positive verdict marks the record for grace-period eviction. A clear verdict
    // trims the buffer to its last keep_last tokens and lowers the score by
    // score_decay; the record stays TRACKED if tokens arrived after the snapshot.
    bool CompleteAnalysis(const ProcessRecord& analyzed, bool positive, size_t keep_last,
                          int score_decay, TimePoint now);

    // Positive records whose grace period has elapsed.
    std::vector<uint32_t> PositiveExpired(TimePoint now, Millis grace) const;

    // Forgets whitelisted pids whose process has exited. Returns how many.
    size_t PruneWhitelistedPids(const ExistsFn& exists_fn);

    bool IsWhitelisted(const std::string& image_path) const;
    const TokenDeriver& GetTokenDeriver() const { return token_deriver_; }

    size_t Size() const;
    size_t Capacity() const { return capacity_; }

private:
    using RecordMap = std::unordered_map<uint32_t, ProcessRecord>;

    struct Stripe {
        mutable std::mutex mutex;
        RecordMap records;
        // Pids identified as a whitelisted image. Later events for them that
        // carry no image are discarded too.
        std::unordered_set<uint32_t> whitelisted_pids;
    };

    Stripe& StripeFor(uint32_t pid) const;
    RecordMap::iterator CreateRecord(Stripe& stripe, uint32_t pid, TimePoint now);
    void AppendToken(ProcessRecord& record, std::string token);
    void MarkWhitelisted(Stripe& stripe, uint32_t pid);
    static int Clamp(int score);

    size_t capacity_;
    std::vector<std::unique_ptr<Stripe>> stripes_;
    std::unordered_set<std::string> whitelist_;
    TokenDeriver token_deriver_;
    std::atomic<uint64_t> next_generation_{1};
};

} // namespace ward
