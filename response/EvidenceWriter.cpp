#include "response/EvidenceWriter.hpp"
#include "core/Crypto.hpp"
#include "core/Logger.hpp"
#include "core/TimeUtils.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace ward {

namespace {

nlohmann::json VerdictToJson(const Verdict& verdict) {
    nlohmann::json j;
    j["pid"] = verdict.pid;
    j["classifier_label"] = verdict.classifier_label ? nlohmann::json(*verdict.classifier_label)
                                                     : nlohmann::json(nullptr);
    j["classifier_confidence"] = verdict.classifier_confidence;
    j["heuristic_score"] = verdict.heuristic_score;
    j["fused_confidence"] = verdict.fused_confidence;
    j["is_malicious"] = verdict.is_malicious;
    j["contributing_tokens"] = verdict.contributing_tokens;
    return j;
}

nlohmann::json ProcessToJson(const ProcessRecord& record) {
    nlohmann::json j;
    j["pid"] = record.pid;
    j["image"] = record.image;
    j["command_line"] = record.command_line;
    j["parent_image"] = record.parent_image;
    // Prefer the sensor's clock; it is what an analyst correlates against.
    uint64_t first_seen_ms = record.first_event_ms != 0 ? record.first_event_ms
                                                        : SteadyToEpochMillis(record.first_seen);
    j["first_seen"] = TimestampToISO8601(first_seen_ms);
    j["last_activity"] = TimestampToISO8601(SteadyToEpochMillis(record.last_activity));
    j["suspicion_score"] = record.suspicion_score;
    j["state"] = ProcessStateToString(record.state);
    j["analysis_count"] = record.analysis_count;
    j["ai_communications"] = record.ai_communications;

    nlohmann::json indicators = nlohmann::json::object();
    for (const auto& [name, count] : record.indicator_counts) {
        indicators[name] = count;
    }
    j["indicator_counts"] = indicators;

    nlohmann::json tokens = nlohmann::json::array();
    for (const auto& token : record.token_buffer) {
        tokens.push_back(token);
    }
    j["token_buffer"] = tokens;
    return j;
}

} // namespace

EvidenceWriter::EvidenceWriter(std::string evidence_dir)
    : evidence_dir_(std::move(evidence_dir)) {}

std::string EvidenceWriter::Serialize(const EvidenceRecord& record) {
    nlohmann::json body;
    body["verdict"] = VerdictToJson(record.verdict);
    body["process"] = ProcessToJson(record.process);

    nlohmann::json j;
    j["uuid"] = record.uuid;
    j["created_at"] = TimestampToISO8601(record.created_at_ms);
    j["pid"] = record.verdict.pid;
    j["verdict"] = body["verdict"];
    j["process"] = body["process"];
    j["sequence_indicators"] = record.sequence_indicators;
    j["body_sha256"] = Sha256Hex(body.dump());
    return j.dump(2);
}

std::optional<EvidenceReceipt> EvidenceWriter::Write(EvidenceRecord record) {
    if (record.uuid.empty()) {
        record.uuid = GenerateUUID();
        if (record.uuid.empty()) {
            LOG_ERROR("Cannot write evidence for PID {}: UUID generation failed", record.verdict.pid);
            return std::nullopt;
        }
    }
    if (record.created_at_ms == 0) {
        record.created_at_ms = CurrentTimeMillis();
    }

    std::error_code ec;
    std::filesystem::create_directories(evidence_dir_, ec);
    if (ec) {
        LOG_ERROR("Cannot create evidence directory {}: {}", evidence_dir_, ec.message());
        return std::nullopt;
    }

    std::string filename = "detection_" + std::to_string(record.verdict.pid) + "_" +
                           TimestampToCompact(record.created_at_ms) + "_" +
                           record.uuid.substr(0, 8) + ".json";
    std::filesystem::path path = std::filesystem::path(evidence_dir_) / filename;

    if (std::filesystem::exists(path, ec)) {
        LOG_ERROR("Evidence file {} already exists, refusing to overwrite", path.string());
        return std::nullopt;
    }

    std::string content;
    try {
        content = Serialize(record);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to serialize evidence for PID {}: {}", record.verdict.pid, e.what());
        return std::nullopt;
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Failed to open evidence file {}", path.string());
        return std::nullopt;
    }
    out << content << "\n";
    out.close();
    if (!out) {
        LOG_ERROR("Failed to write evidence file {}", path.string());
        return std::nullopt;
    }

    EvidenceReceipt receipt;
    receipt.path = path.string();
    receipt.file_sha256 = FileSha256Hex(receipt.path);

    LOG_INFO("Evidence for PID {} saved to {}", record.verdict.pid, receipt.path);
    return receipt;
}

} // namespace ward
