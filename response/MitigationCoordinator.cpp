#include "response/MitigationCoordinator.hpp"
#include "core/Crypto.hpp"
#include "core/Logger.hpp"
#include "core/StringUtils.hpp"
#include "core/TimeUtils.hpp"
#include "persistence/DetectionStore.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace ward {

namespace {
constexpr size_t LOGGED_TOKEN_COUNT = 10;
}

MitigationCoordinator::MitigationCoordinator(const MitigationConfig& config,
                                             const DetectionConfig& detection,
                                             std::shared_ptr<ProcessController> controller,
                                             std::unique_ptr<AlertDispatcher> dispatcher,
                                             std::shared_ptr<DetectionStore> history)
    : config_(config),
      severity_rules_(detection),
      evidence_writer_(config.evidence_dir),
      controller_(std::move(controller)),
      dispatcher_(std::move(dispatcher)),
      history_(std::move(history)) {
    LOG_INFO("MitigationCoordinator ready (quarantine={}, evidence={}, alerts={})",
             config_.quarantine_enabled, config_.save_evidence,
             dispatcher_ ? config_.alert_endpoint : std::string("disabled"));
}

MitigationCoordinator::~MitigationCoordinator() {
    Shutdown();
}

void MitigationCoordinator::OnDetection(const Verdict& verdict, const ProcessRecord& record,
                                        const std::vector<std::string>& sequence_indicators) {
    detections_++;
    {
        std::lock_guard<std::mutex> lock(indicator_mutex_);
        for (const auto& [name, count] : record.indicator_counts) {
            indicator_counts_[name] += count;
        }
        for (const auto& name : sequence_indicators) {
            indicator_counts_[name]++;
        }
    }

    Severity severity = severity_rules_.Classify(verdict);
    uint64_t now_ms = CurrentTimeMillis();
    std::string uuid = GenerateUUID();

    LogDetection(verdict, record, severity);

    // 1. Evidence
    std::optional<EvidenceReceipt> evidence;
    if (config_.save_evidence) {
        evidence = SaveEvidence(verdict, record, sequence_indicators, uuid, now_ms);
    }

    // 2. Quarantine
    bool quarantined = false;
    if (config_.quarantine_enabled) {
        try {
            quarantined = Quarantine(verdict.pid);
        } catch (const std::exception& e) {
            termination_failures_++;
            LOG_ERROR("Quarantine of PID {} raised: {}", verdict.pid, e.what());
        }
    }

    // 3. Alert
    if (dispatcher_) {
        try {
            dispatcher_->Dispatch(BuildAlertPayload(verdict, record, severity, now_ms));
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to queue alert for PID {}: {}", verdict.pid, e.what());
        }
    }

    // 4. History
    if (history_) {
        RecordHistory(verdict, record, severity, quarantined, evidence, uuid, now_ms);
    }
}

void MitigationCoordinator::LogDetection(const Verdict& verdict, const ProcessRecord& record,
                                         Severity severity) const {
    size_t shown = std::min(LOGGED_TOKEN_COUNT, record.token_buffer.size());
    std::vector<std::string> first_tokens(record.token_buffer.begin(),
                                          record.token_buffer.begin() + static_cast<std::ptrdiff_t>(shown));

    LOG_CRITICAL("MALICIOUS PROCESS DETECTED: PID {} severity={}", verdict.pid, SeverityToString(severity));
    LOG_CRITICAL("  Label: {} (confidence {:.3f}), heuristic {}, fused {:.3f}",
                 verdict.classifier_label.value_or("none"), verdict.classifier_confidence,
                 verdict.heuristic_score, verdict.fused_confidence);
    LOG_CRITICAL("  Image: {}", record.image.empty() ? "unknown" : record.image);
    LOG_CRITICAL("  Command line: {}", record.command_line.empty() ? "unknown" : record.command_line);
    LOG_CRITICAL("  First tokens: {}", Join(first_tokens, ", "));
}

std::optional<EvidenceReceipt> MitigationCoordinator::SaveEvidence(
    const Verdict& verdict, const ProcessRecord& record,
    const std::vector<std::string>& sequence_indicators,
    const std::string& uuid, uint64_t now_ms) {
    try {
        EvidenceRecord evidence;
        evidence.uuid = uuid;
        evidence.created_at_ms = now_ms;
        evidence.verdict = verdict;
        evidence.process = record;
        evidence.sequence_indicators = sequence_indicators;

        auto receipt = evidence_writer_.Write(std::move(evidence));
        if (receipt) {
            evidence_saved_++;
            return receipt;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Evidence capture for PID {} raised: {}", verdict.pid, e.what());
    }

    evidence_failures_++;
    LOG_ERROR("Evidence for PID {} was not saved", verdict.pid);
    return std::nullopt;
}

bool MitigationCoordinator::Quarantine(uint32_t pid) {
    if (!controller_) {
        LOG_WARN("No process controller available, cannot quarantine PID {}", pid);
        termination_failures_++;
        return false;
    }

    SignalResult request = controller_->RequestTermination(pid);
    if (request == SignalResult::NOT_FOUND) {
        LOG_INFO("PID {} already exited before quarantine", pid);
        quarantines_++;
        return true;
    }

    if (request == SignalResult::DELIVERED &&
        controller_->WaitForExit(pid, config_.termination_timeout)) {
        LOG_WARN("PID {} terminated", pid);
        quarantines_++;
        return true;
    }

    LOG_WARN("PID {} did not exit after termination request ({}), forcing kill",
             pid, SignalResultToString(request));

    SignalResult forced = controller_->ForceKill(pid);
    if (forced == SignalResult::DELIVERED || forced == SignalResult::NOT_FOUND) {
        LOG_WARN("PID {} killed", pid);
        quarantines_++;
        return true;
    }

    termination_failures_++;
    LOG_ERROR("Failed to quarantine PID {}: {}", pid, SignalResultToString(forced));
    return false;
}

std::string MitigationCoordinator::BuildAlertPayload(const Verdict& verdict, const ProcessRecord& record,
                                                     Severity severity, uint64_t timestamp_ms) {
    nlohmann::json j;
    j["type"] = "malware_detection";
    j["severity"] = SeverityToString(severity);
    j["label"] = verdict.classifier_label ? nlohmann::json(*verdict.classifier_label)
                                          : nlohmann::json(nullptr);
    j["confidence"] = verdict.classifier_confidence;
    j["fused_confidence"] = verdict.fused_confidence;
    j["heuristic_score"] = verdict.heuristic_score;
    j["pid"] = verdict.pid;
    j["image"] = record.image;
    j["timestamp"] = TimestampToISO8601(timestamp_ms);
    return j.dump();
}

void MitigationCoordinator::RecordHistory(const Verdict& verdict, const ProcessRecord& record,
                                          Severity severity, bool quarantined,
                                          const std::optional<EvidenceReceipt>& evidence,
                                          const std::string& uuid, uint64_t now_ms) {
    try {
        DetectionRow row;
        row.uuid = uuid.empty() ? std::to_string(verdict.pid) + "-" + std::to_string(now_ms) : uuid;
        row.detected_at_ms = now_ms;
        row.pid = verdict.pid;
        row.image = record.image;
        row.command_line = record.command_line;
        row.label = verdict.classifier_label.value_or("");
        row.confidence = verdict.classifier_confidence;
        row.heuristic_score = verdict.heuristic_score;
        row.fused_confidence = verdict.fused_confidence;
        row.severity = SeverityToString(severity);
        row.quarantined = quarantined;
        if (evidence) {
            row.evidence_path = evidence->path;
            row.evidence_sha256 = evidence->file_sha256;
        }
        row.tokens = verdict.contributing_tokens;
        row.indicators = record.indicator_counts;

        if (!history_->InsertDetection(row)) {
            history_failures_++;
        }
    } catch (const std::exception& e) {
        history_failures_++;
        LOG_ERROR("Recording detection history for PID {} raised: {}", verdict.pid, e.what());
    }
}

MitigationStats MitigationCoordinator::GetStats() const {
    MitigationStats stats;
    stats.detections = detections_.load();
    stats.quarantines = quarantines_.load();
    stats.evidence_saved = evidence_saved_.load();
    stats.evidence_failures = evidence_failures_.load();
    stats.termination_failures = termination_failures_.load();
    stats.history_failures = history_failures_.load();
    if (dispatcher_) {
        stats.alert_successes = dispatcher_->GetSuccessCount();
        stats.alert_failures = dispatcher_->GetFailureCount();
    }
    {
        std::lock_guard<std::mutex> lock(indicator_mutex_);
        stats.indicator_counts = indicator_counts_;
    }
    return stats;
}

void MitigationCoordinator::FlushAlerts() {
    if (dispatcher_) {
        dispatcher_->Flush();
    }
}

void MitigationCoordinator::Shutdown() {
    if (dispatcher_) {
        dispatcher_->Shutdown();
    }
}

} // namespace ward
