#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ward {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

enum class BehaviorKind {
    PROCESS_CREATE,
    NETWORK_CONNECT,
    IMAGE_LOAD,
    REMOTE_THREAD_CREATE,
    PROCESS_ACCESS,
    FILE_CREATE,
    REGISTRY_WRITE,
    DNS_QUERY,
    PROCESS_TAMPERING,
    OTHER
};

inline std::string BehaviorKindToString(BehaviorKind kind) {
    switch (kind) {
        case BehaviorKind::PROCESS_CREATE:       return "PROCESS_CREATE";
        case BehaviorKind::NETWORK_CONNECT:      return "NETWORK_CONNECT";
        case BehaviorKind::IMAGE_LOAD:           return "IMAGE_LOAD";
        case BehaviorKind::REMOTE_THREAD_CREATE: return "REMOTE_THREAD_CREATE";
        case BehaviorKind::PROCESS_ACCESS:       return "PROCESS_ACCESS";
        case BehaviorKind::FILE_CREATE:          return "FILE_CREATE";
        case BehaviorKind::REGISTRY_WRITE:       return "REGISTRY_WRITE";
        case BehaviorKind::DNS_QUERY:            return "DNS_QUERY";
        case BehaviorKind::PROCESS_TAMPERING:    return "PROCESS_TAMPERING";
        case BehaviorKind::OTHER:                return "OTHER";
    }
    return "UNKNOWN";
}

// Attribute keys filled by the normalizer. Absent fields are simply missing
// from the map.
namespace attr {
constexpr const char* IMAGE = "image";
constexpr const char* COMMAND_LINE = "command_line";
constexpr const char* PARENT_IMAGE = "parent_image";
constexpr const char* DEST_IP = "dest_ip";
constexpr const char* DEST_HOST = "dest_host";
constexpr const char* DEST_PORT = "dest_port";
constexpr const char* IMAGE_LOADED = "image_loaded";
constexpr const char* TARGET_PID = "target_pid";
constexpr const char* TARGET_IMAGE = "target_image";
constexpr const char* TARGET_FILENAME = "target_filename";
constexpr const char* TARGET_OBJECT = "target_object";
constexpr const char* DETAILS = "details";
constexpr const char* QUERY_NAME = "query_name";
constexpr const char* TAMPER_TYPE = "tamper_type";
} // namespace attr

struct BehaviorEvent {
    uint32_t pid;
    BehaviorKind kind;
    std::unordered_map<std::string, std::string> attributes;
    TimePoint observed_at;
    // Wall-clock time reported by the source, when it sent one.
    std::optional<uint64_t> source_time_ms;

    BehaviorEvent(uint32_t p, BehaviorKind k, TimePoint at = Clock::now())
        : pid(p), kind(k), observed_at(at) {}

    // Empty string when the attribute is absent.
    const std::string& Attr(const std::string& key) const;
};

// One heuristic indicator firing: its name and the score delta it contributes.
struct IndicatorHit {
    std::string name;
    int delta;
};

enum class ProcessState {
    TRACKED,
    ANALYZED_CLEAR,
    ANALYZED_POSITIVE
};

inline std::string ProcessStateToString(ProcessState state) {
    switch (state) {
        case ProcessState::TRACKED:           return "TRACKED";
        case ProcessState::ANALYZED_CLEAR:    return "ANALYZED_CLEAR";
        case ProcessState::ANALYZED_POSITIVE: return "ANALYZED_POSITIVE";
    }
    return "UNKNOWN";
}

struct ProcessRecord {
    uint32_t pid{0};
    std::string image;
    std::string command_line;
    std::string parent_image;
    TimePoint first_seen{};
    TimePoint last_activity{};
    // Source timestamp of the earliest event that carried one, 0 if none did.
    uint64_t first_event_ms{0};
    int suspicion_score{0};
    std::deque<std::string> token_buffer;
    std::map<std::string, uint32_t> indicator_counts;
    ProcessState state{ProcessState::TRACKED};
    std::optional<TimePoint> positive_at;
    uint32_t analysis_count{0};
    uint32_t ai_communications{0};
    // Distinguishes records created for the same pid after eviction.
    uint64_t generation{0};
    // Tokens appended over the record's lifetime; unaffected by trimming.
    uint64_t appends{0};
};

struct Verdict {
    uint32_t pid{0};
    std::optional<std::string> classifier_label;
    double classifier_confidence{0.0};
    int heuristic_score{0};
    double fused_confidence{0.0};
    bool is_malicious{false};
    std::vector<std::string> contributing_tokens;
};

struct EvidenceRecord {
    std::string uuid;
    uint64_t created_at_ms{0};
    Verdict verdict;
    ProcessRecord process;
    std::vector<std::string> sequence_indicators;
};

} // namespace ward
