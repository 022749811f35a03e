#include "engine/ProcessBehaviorStore.hpp"
#include "core/Logger.hpp"
#include "core/StringUtils.hpp"
#include <algorithm>

namespace ward {

namespace {
constexpr size_t MAX_WHITELISTED_PIDS_PER_STRIPE = 1024;
}

ProcessBehaviorStore::ProcessBehaviorStore(const StoreConfig& config, const HeuristicConfig& heuristics)
    : capacity_(std::max<size_t>(config.buffer_capacity, 1)),
      token_deriver_(heuristics) {
    size_t stripe_count = std::max<size_t>(config.lock_stripes, 1);
    stripes_.reserve(stripe_count);
    for (size_t i = 0; i < stripe_count; ++i) {
        stripes_.push_back(std::make_unique<Stripe>());
    }

    for (const auto& name : config.whitelist) {
        whitelist_.insert(ToLower(name));
    }
}

ProcessBehaviorStore::Stripe& ProcessBehaviorStore::StripeFor(uint32_t pid) const {
    return *stripes_[pid % stripes_.size()];
}

int ProcessBehaviorStore::Clamp(int score) {
    return std::clamp(score, 0, 100);
}

bool ProcessBehaviorStore::IsWhitelisted(const std::string& image_path) const {
    if (image_path.empty()) {
        return false;
    }
    return whitelist_.count(ToLower(Basename(image_path))) > 0;
}

ProcessBehaviorStore::RecordMap::iterator ProcessBehaviorStore::CreateRecord(Stripe& stripe, uint32_t pid,
                                                                           TimePoint now) {
    ProcessRecord record;
    record.pid = pid;
    record.first_seen = now;
    record.generation = next_generation_++;
    return stripe.records.emplace(pid, std::move(record)).first;
}

void ProcessBehaviorStore::MarkWhitelisted(Stripe& stripe, uint32_t pid) {
    if (stripe.whitelisted_pids.size() >= MAX_WHITELISTED_PIDS_PER_STRIPE &&
        stripe.whitelisted_pids.count(pid) == 0) {
        return;
    }
    stripe.whitelisted_pids.insert(pid);
}

void ProcessBehaviorStore::AppendToken(ProcessRecord& record, std::string token) {
    while (record.token_buffer.size() >= capacity_) {
        record.token_buffer.pop_front();
    }
    record.token_buffer.push_back(std::move(token));
    record.appends++;
    if (record.state == ProcessState::ANALYZED_CLEAR) {
        record.state = ProcessState::TRACKED;
    }
}

RecordOutcome ProcessBehaviorStore::RecordEvent(const BehaviorEvent& event) {
    const std::string& image = event.Attr(attr::IMAGE);
    std::string token = token_deriver_.Derive(event);

    Stripe& stripe = StripeFor(event.pid);
    std::lock_guard<std::mutex> lock(stripe.mutex);

    auto it = stripe.records.find(event.pid);

    if (IsWhitelisted(image)) {
        // The pid turned out to belong to a trusted image; stop tracking it.
        if (it != stripe.records.end()) {
            LOG_DEBUG("PID {} identified as whitelisted image {}, dropping record", event.pid, image);
            stripe.records.erase(it);
        }
        MarkWhitelisted(stripe, event.pid);
        return RecordOutcome::DISCARDED;
    }

    auto trusted = stripe.whitelisted_pids.find(event.pid);
    if (trusted != stripe.whitelisted_pids.end()) {
        if (image.empty()) {
            return RecordOutcome::DISCARDED;
        }
        // A different image under a trusted pid means the pid was reused.
        stripe.whitelisted_pids.erase(trusted);
    }

    RecordOutcome outcome = RecordOutcome::APPENDED;
    if (it == stripe.records.end()) {
        it = CreateRecord(stripe, event.pid, event.observed_at);
        outcome = RecordOutcome::CREATED;
        LOG_DEBUG("Tracking new process {} ({})", event.pid, image.empty() ? "unknown image" : image);
    }

    ProcessRecord& record = it->second;
    if (!image.empty() && (record.image.empty() || event.kind == BehaviorKind::PROCESS_CREATE)) {
        record.image = image;
    }
    if (event.kind == BehaviorKind::PROCESS_CREATE) {
        const std::string& cmdline = event.Attr(attr::COMMAND_LINE);
        const std::string& parent = event.Attr(attr::PARENT_IMAGE);
        if (!cmdline.empty()) record.command_line = cmdline;
        if (!parent.empty()) record.parent_image = parent;
    }

    if (record.first_event_ms == 0 && event.source_time_ms) {
        record.first_event_ms = *event.source_time_ms;
    }

    AppendToken(record, std::move(token));
    record.last_activity = std::max(record.last_activity, event.observed_at);
    return outcome;
}

RecordOutcome ProcessBehaviorStore::RecordToken(uint32_t pid, const std::string& token, TimePoint now) {
    Stripe& stripe = StripeFor(pid);
    std::lock_guard<std::mutex> lock(stripe.mutex);

    if (stripe.whitelisted_pids.count(pid) > 0) {
        return RecordOutcome::DISCARDED;
    }

    RecordOutcome outcome = RecordOutcome::APPENDED;
    auto it = stripe.records.find(pid);
    if (it == stripe.records.end()) {
        it = CreateRecord(stripe, pid, now);
        outcome = RecordOutcome::CREATED;
    }

    AppendToken(it->second, token);
    it->second.last_activity = std::max(it->second.last_activity, now);
    return outcome;
}

std::optional<int> ProcessBehaviorStore::AdjustScore(uint32_t pid, int delta) {
    Stripe& stripe = StripeFor(pid);
    std::lock_guard<std::mutex> lock(stripe.mutex);

    auto it = stripe.records.find(pid);
    if (it == stripe.records.end()) {
        return std::nullopt;
    }

    ProcessRecord& record = it->second;
    // Widen before adding so extreme deltas cannot overflow.
    long long raw = static_cast<long long>(record.suspicion_score) + delta;
    record.suspicion_score = static_cast<int>(std::clamp<long long>(raw, 0, 100));
    return record.suspicion_score;
}

std::optional<int> ProcessBehaviorStore::ApplyIndicators(uint32_t pid, const std::vector<IndicatorHit>& hits,
                                                         bool ai_communication) {
    Stripe& stripe = StripeFor(pid);
    std::lock_guard<std::mutex> lock(stripe.mutex);

    auto it = stripe.records.find(pid);
    if (it == stripe.records.end()) {
        return std::nullopt;
    }

    ProcessRecord& record = it->second;
    for (const auto& hit : hits) {
        long long raw = static_cast<long long>(record.suspicion_score) + hit.delta;
        record.suspicion_score = static_cast<int>(std::clamp<long long>(raw, 0, 100));
        record.indicator_counts[hit.name]++;
        LOG_DEBUG("PID {} indicator '{}' ({:+d}) -> score {}", pid, hit.name, hit.delta,
                  record.suspicion_score);
    }
    if (ai_communication) {
        record.ai_communications++;
    }
    return Clamp(record.suspicion_score);
}

std::optional<ProcessRecord> ProcessBehaviorStore::Snapshot(uint32_t pid) const {
    Stripe& stripe = StripeFor(pid);
    std::lock_guard<std::mutex> lock(stripe.mutex);

    auto it = stripe.records.find(pid);
    if (it == stripe.records.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ProcessBehaviorStore::Evict(uint32_t pid) {
    Stripe& stripe = StripeFor(pid);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    stripe.whitelisted_pids.erase(pid);
    return stripe.records.erase(pid) > 0;
}

size_t ProcessBehaviorStore::PruneWhitelistedPids(const ExistsFn& exists_fn) {
    if (!exists_fn) {
        return 0;
    }

    std::vector<uint32_t> known;
    for (const auto& stripe : stripes_) {
        std::lock_guard<std::mutex> lock(stripe->mutex);
        known.insert(known.end(), stripe->whitelisted_pids.begin(), stripe->whitelisted_pids.end());
    }

    size_t pruned = 0;
    for (uint32_t pid : known) {
        if (exists_fn(pid)) {
            continue;
        }
        Stripe& stripe = StripeFor(pid);
        std::lock_guard<std::mutex> lock(stripe.mutex);
        pruned += stripe.whitelisted_pids.erase(pid);
    }
    return pruned;
}

std::vector<uint32_t> ProcessBehaviorStore::StaleProcesses(TimePoint now, Millis window,
                                                           const ExistsFn& exists_fn) const {
    std::vector<uint32_t> stale;
    std::vector<uint32_t> active;
    TimePoint cutoff = now - window;

    for (const auto& stripe : stripes_) {
        std::lock_guard<std::mutex> lock(stripe->mutex);
        for (const auto& [pid, record] : stripe->records) {
            if (record.state == ProcessState::ANALYZED_POSITIVE) {
                continue;
            }
            if (record.last_activity < cutoff) {
                stale.push_back(pid);
            } else {
                active.push_back(pid);
            }
        }
    }

    if (exists_fn) {
        for (uint32_t pid : active) {
            if (!exists_fn(pid)) {
                stale.push_back(pid);
            }
        }
    }

    std::sort(stale.begin(), stale.end());
    return stale;
}

std::vector<uint32_t> ProcessBehaviorStore::EligibleForSweep(size_t min_tokens) const {
    std::vector<uint32_t> eligible;
    for (const auto& stripe : stripes_) {
        std::lock_guard<std::mutex> lock(stripe->mutex);
        for (const auto& [pid, record] : stripe->records) {
            if (record.state == ProcessState::TRACKED &&
                !record.token_buffer.empty() &&
                record.token_buffer.size() >= min_tokens) {
                eligible.push_back(pid);
            }
        }
    }
    std::sort(eligible.begin(), eligible.end());
    return eligible;
}

bool ProcessBehaviorStore::CompleteAnalysis(const ProcessRecord& analyzed, bool positive, size_t keep_last,
                                            int score_decay, TimePoint now) {
    Stripe& stripe = StripeFor(analyzed.pid);
    std::lock_guard<std::mutex> lock(stripe.mutex);

    auto it = stripe.records.find(analyzed.pid);
    if (it == stripe.records.end() || it->second.generation != analyzed.generation) {
        LOG_DEBUG("PID {} changed identity during analysis, verdict not applied", analyzed.pid);
        return false;
    }

    ProcessRecord& record = it->second;
    record.analysis_count++;

    if (positive) {
        record.state = ProcessState::ANALYZED_POSITIVE;
        record.positive_at = now;
        return true;
    }

    // Tokens appended during classification still need a look.
    record.state = record.appends == analyzed.appends ? ProcessState::ANALYZED_CLEAR
                                                      : ProcessState::TRACKED;
    while (record.token_buffer.size() > keep_last) {
        record.token_buffer.pop_front();
    }
    if (score_decay > 0) {
        record.suspicion_score = Clamp(record.suspicion_score - score_decay);
    }
    return true;
}

std::vector<uint32_t> ProcessBehaviorStore::PositiveExpired(TimePoint now, Millis grace) const {
    std::vector<uint32_t> expired;
    for (const auto& stripe : stripes_) {
        std::lock_guard<std::mutex> lock(stripe->mutex);
        for (const auto& [pid, record] : stripe->records) {
            if (record.state == ProcessState::ANALYZED_POSITIVE &&
                record.positive_at && *record.positive_at + grace <= now) {
                expired.push_back(pid);
            }
        }
    }
    return expired;
}

size_t ProcessBehaviorStore::Size() const {
    size_t total = 0;
    for (const auto& stripe : stripes_) {
        std::lock_guard<std::mutex> lock(stripe->mutex);
        total += stripe->records.size();
    }
    return total;
}

} // namespace ward
