#include "engine/HeuristicEngine.hpp"
#include "core/Logger.hpp"
#include "core/StringUtils.hpp"

namespace ward {

namespace {

bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

HeuristicEngine::HeuristicEngine(const HeuristicConfig& config)
    : config_(config), deriver_(config) {
    for (const auto& pattern : config.persistence_key_patterns) {
        persistence_patterns_.push_back(ToLower(pattern));
    }
    for (const auto& dir : config.suspicious_directories) {
        if (!dir.empty()) {
            suspicious_directories_.push_back(ToLower(dir));
        }
    }
    for (const auto& keyword : config.ai_keywords) {
        if (!keyword.empty()) {
            ai_keywords_.push_back(ToLower(keyword));
        }
    }
}

bool HeuristicEngine::IsPersistenceKey(const std::string& key_path) const {
    if (key_path.empty()) {
        return false;
    }
    std::string lowered = ToLower(key_path);
    for (const auto& pattern : persistence_patterns_) {
        if (WildcardMatch(pattern, lowered)) {
            return true;
        }
    }
    return false;
}

bool HeuristicEngine::IsSuspiciousDirectory(const std::string& path) const {
    if (path.empty()) {
        return false;
    }
    std::string lowered = ToLower(path);
    for (const auto& dir : suspicious_directories_) {
        if (lowered.find(dir) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool HeuristicEngine::MatchesAiKeyword(const std::string& value) const {
    if (value.empty()) {
        return false;
    }
    std::string lowered = ToLower(value);
    for (const auto& keyword : ai_keywords_) {
        if (lowered.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

HeuristicResult HeuristicEngine::Evaluate(const BehaviorEvent& event) const {
    HeuristicResult result;

    switch (event.kind) {
        case BehaviorKind::REMOTE_THREAD_CREATE:
            result.hits.push_back({indicator::INJECTION, config_.injection_delta});
            result.immediate = true;
            break;

        case BehaviorKind::PROCESS_ACCESS:
            if (deriver_.IsCriticalProcess(event.Attr(attr::TARGET_IMAGE))) {
                result.hits.push_back({indicator::CRITICAL_PROCESS_ACCESS, config_.critical_access_delta});
                result.immediate = true;
            }
            break;

        case BehaviorKind::NETWORK_CONNECT:
            if (MatchesAiKeyword(event.Attr(attr::DEST_HOST)) ||
                MatchesAiKeyword(event.Attr(attr::DEST_IP))) {
                result.hits.push_back({indicator::AI_COMMUNICATION, config_.ai_communication_delta});
                result.immediate = true;
                result.ai_communication = true;
            }
            break;

        case BehaviorKind::DNS_QUERY:
            if (MatchesAiKeyword(event.Attr(attr::QUERY_NAME))) {
                result.hits.push_back({indicator::AI_COMMUNICATION, config_.ai_communication_delta});
                result.immediate = true;
                result.ai_communication = true;
            }
            break;

        case BehaviorKind::REGISTRY_WRITE:
            if (IsPersistenceKey(event.Attr(attr::TARGET_OBJECT))) {
                result.hits.push_back({indicator::PERSISTENCE, config_.persistence_delta});
            }
            break;

        case BehaviorKind::FILE_CREATE: {
            const std::string& filename = event.Attr(attr::TARGET_FILENAME);
            if (deriver_.IsSuspiciousExtension(filename)) {
                result.hits.push_back({indicator::SUSPICIOUS_EXTENSION, config_.suspicious_extension_delta});
            }
            if (IsSuspiciousDirectory(filename)) {
                result.hits.push_back({indicator::SUSPICIOUS_DIRECTORY, config_.suspicious_directory_delta});
            }
            break;
        }

        case BehaviorKind::PROCESS_TAMPERING:
            result.hits.push_back({indicator::PROCESS_TAMPERING, config_.tampering_delta});
            result.immediate = true;
            break;

        case BehaviorKind::PROCESS_CREATE:
        case BehaviorKind::IMAGE_LOAD:
        case BehaviorKind::OTHER:
            break;
    }

    if (!result.hits.empty()) {
        LOG_TRACE("PID {} {} produced {} indicator(s)", event.pid,
                  BehaviorKindToString(event.kind), result.hits.size());
    }
    return result;
}

std::vector<IndicatorHit> HeuristicEngine::EvaluateSequence(const std::deque<std::string>& tokens) const {
    std::vector<IndicatorHit> hits;
    if (tokens.size() < 2) {
        return hits;
    }

    if (DetectInjectionChain(tokens)) {
        hits.push_back({indicator::INJECTION_CHAIN, config_.injection_chain_bonus});
    }
    if (DetectDropper(tokens)) {
        hits.push_back({indicator::DROPPER, config_.dropper_bonus});
    }
    if (DetectPersistenceLaunch(tokens)) {
        hits.push_back({indicator::PERSISTENCE_LAUNCH, config_.persistence_launch_bonus});
    }
    return hits;
}

int HeuristicEngine::TotalDelta(const std::vector<IndicatorHit>& hits) {
    int total = 0;
    for (const auto& hit : hits) {
        total += hit.delta;
    }
    return total;
}

bool HeuristicEngine::DetectInjectionChain(const std::deque<std::string>& tokens) const {
    // VirtualAlloc* / WriteProcessMemory, later CreateRemoteThread
    bool staged = false;
    for (const auto& token : tokens) {
        if (StartsWith(token, "VirtualAlloc") || token == "WriteProcessMemory") {
            staged = true;
        } else if (staged && token == "CreateRemoteThread") {
            return true;
        }
    }
    return false;
}

bool HeuristicEngine::DetectDropper(const std::deque<std::string>& tokens) const {
    // CreateFile:<exe-like> -> CreateProcess -> connect*
    int step = 0;
    for (const auto& token : tokens) {
        if (step == 0 && StartsWith(token, "CreateFile:")) {
            step = 1;
        } else if (step == 1 && token == "CreateProcess") {
            step = 2;
        } else if (step == 2 && StartsWith(token, "connect")) {
            return true;
        }
    }
    return false;
}

bool HeuristicEngine::DetectPersistenceLaunch(const std::deque<std::string>& tokens) const {
    bool registry_written = false;
    for (const auto& token : tokens) {
        if (token == "RegSetValue") {
            registry_written = true;
        } else if (registry_written && token == "CreateProcess") {
            return true;
        }
    }
    return false;
}

} // namespace ward
