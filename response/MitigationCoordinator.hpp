#pragma once

#include "core/Config.hpp"
#include "engine/DetectionHandler.hpp"
#include "engine/FusionEngine.hpp"
#include "response/AlertDispatcher.hpp"
#include "response/EvidenceWriter.hpp"
#include "response/ProcessController.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ward {

class DetectionStore;

struct MitigationStats {
    uint64_t detections{0};
    uint64_t quarantines{0};
    uint64_t evidence_saved{0};
    uint64_t evidence_failures{0};
    uint64_t termination_failures{0};
    uint64_t alert_successes{0};
    uint64_t alert_failures{0};
    uint64_t history_failures{0};
    std::map<std::string, uint64_t> indicator_counts;
};

// Acts on malicious verdicts: evidence, quarantine, alert, history. Every step
// is isolated from the others; a failing step is logged and counted.
class MitigationCoordinator : public DetectionHandler {
public:
    // controller, dispatcher and history may be null; the matching step is skipped.
    MitigationCoordinator(const MitigationConfig& config,
                          const DetectionConfig& detection,
                          std::shared_ptr<ProcessController> controller,
                          std::unique_ptr<AlertDispatcher> dispatcher,
                          std::shared_ptr<DetectionStore> history);
    ~MitigationCoordinator() override;

    void OnDetection(const Verdict& verdict, const ProcessRecord& record,
                     const std::vector<std::string>& sequence_indicators) override;

    // Returns true when the process is confirmed gone.
    bool Quarantine(uint32_t pid);

    static std::string BuildAlertPayload(const Verdict& verdict, const ProcessRecord& record,
                                         Severity severity, uint64_t timestamp_ms);

    MitigationStats GetStats() const;

    // Waits for queued alerts to be attempted.
    void FlushAlerts();
    void Shutdown();

private:
    void LogDetection(const Verdict& verdict, const ProcessRecord& record, Severity severity) const;
    std::optional<EvidenceReceipt> SaveEvidence(const Verdict& verdict, const ProcessRecord& record,
                                                const std::vector<std::string>& sequence_indicators,
                                                const std::string& uuid, uint64_t now_ms);
    void RecordHistory(const Verdict& verdict, const ProcessRecord& record, Severity severity,
                       bool quarantined, const std::optional<EvidenceReceipt>& evidence,
                       const std::string& uuid, uint64_t now_ms);

    MitigationConfig config_;
    FusionEngine severity_rules_;
    EvidenceWriter evidence_writer_;
    std::shared_ptr<ProcessController> controller_;
    std::unique_ptr<AlertDispatcher> dispatcher_;
    std::shared_ptr<DetectionStore> history_;

    std::atomic<uint64_t> detections_{0};
    std::atomic<uint64_t> quarantines_{0};
    std::atomic<uint64_t> evidence_saved_{0};
    std::atomic<uint64_t> evidence_failures_{0};
    std::atomic<uint64_t> termination_failures_{0};
    std::atomic<uint64_t> history_failures_{0};

    mutable std::mutex indicator_mutex_;
    std::map<std::string, uint64_t> indicator_counts_;
};

} // namespace ward
