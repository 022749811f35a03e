#pragma once

#include "core/Config.hpp"
#include "engine/BehaviorTypes.hpp"
#include "engine/TokenDeriver.hpp"
#include <deque>
#include <string>
#include <vector>

namespace ward {

namespace indicator {
constexpr const char* INJECTION = "injection";
constexpr const char* CRITICAL_PROCESS_ACCESS = "critical_process_access";
constexpr const char* AI_COMMUNICATION = "ai_communication";
constexpr const char* PERSISTENCE = "persistence";
constexpr const char* SUSPICIOUS_EXTENSION = "suspicious_extension";
constexpr const char* SUSPICIOUS_DIRECTORY = "suspicious_directory";
constexpr const char* PROCESS_TAMPERING = "process_tampering";

constexpr const char* INJECTION_CHAIN = "injection_chain";
constexpr const char* DROPPER = "dropper";
constexpr const char* PERSISTENCE_LAUNCH = "persistence_launch";
} // namespace indicator

struct HeuristicResult {
    std::vector<IndicatorHit> hits;
    bool immediate{false};
    bool ai_communication{false};

    bool Empty() const { return hits.empty(); }
};

// Stateless indicator rules. Evaluate() looks at a single event; EvaluateSequence()
// looks for ordered patterns across a token buffer.
class HeuristicEngine {
public:
    explicit HeuristicEngine(const HeuristicConfig& config);

    HeuristicResult Evaluate(const BehaviorEvent& event) const;

    std::vector<IndicatorHit> EvaluateSequence(const std::deque<std::string>& tokens) const;

    static int TotalDelta(const std::vector<IndicatorHit>& hits);

    const HeuristicConfig& GetConfig() const { return config_; }

    bool IsPersistenceKey(const std::string& key_path) const;
    bool IsSuspiciousDirectory(const std::string& path) const;
    bool MatchesAiKeyword(const std::string& value) const;

private:
    bool DetectInjectionChain(const std::deque<std::string>& tokens) const;
    bool DetectDropper(const std::deque<std::string>& tokens) const;
    bool DetectPersistenceLaunch(const std::deque<std::string>& tokens) const;

    HeuristicConfig config_;
    TokenDeriver deriver_;
    std::vector<std::string> persistence_patterns_;
    std::vector<std::string> suspicious_directories_;
    std::vector<std::string> ai_keywords_;
};

} // namespace ward
