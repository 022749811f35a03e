#pragma once

#include "core/Config.hpp"
#include "engine/BehaviorTypes.hpp"
#include <optional>
#include <string>

namespace ward {

enum class Severity {
    HIGH,
    CRITICAL
};

inline std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
    }
    return "high";
}

// Combines the heuristic score with the classifier confidence:
//   fused = (confidence + heuristic / 100) / 2
//   malicious = fused > threshold
//            || heuristic > hard ceiling
//            || (confidence > ml floor && heuristic > heuristic floor)
// A "Benign" label vetoes everything except the hard ceiling.
class FusionEngine {
public:
    explicit FusionEngine(const DetectionConfig& config);

    // pid and contributing_tokens are left for the caller to fill.
    Verdict Decide(int heuristic_score, double confidence,
                   const std::optional<std::string>& label) const;

    Severity Classify(const Verdict& verdict) const;

    const DetectionConfig& GetConfig() const { return config_; }

private:
    static bool IsBenignLabel(const std::optional<std::string>& label);

    DetectionConfig config_;
};

} // namespace ward
