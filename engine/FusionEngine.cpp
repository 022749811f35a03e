#include "engine/FusionEngine.hpp"
#include "core/StringUtils.hpp"
#include <algorithm>

namespace ward {

namespace {
constexpr double CRITICAL_FUSED_CONFIDENCE = 0.8;
}

FusionEngine::FusionEngine(const DetectionConfig& config) : config_(config) {}

bool FusionEngine::IsBenignLabel(const std::optional<std::string>& label) {
    return label && ToLower(*label) == "benign";
}

Verdict FusionEngine::Decide(int heuristic_score, double confidence,
                             const std::optional<std::string>& label) const {
    Verdict verdict;
    verdict.classifier_label = label;
    verdict.classifier_confidence = std::clamp(confidence, 0.0, 1.0);
    verdict.heuristic_score = std::clamp(heuristic_score, 0, 100);

    double normalized = verdict.heuristic_score / 100.0;
    verdict.fused_confidence = (verdict.classifier_confidence + normalized) / 2.0;

    bool over_ceiling = verdict.heuristic_score > config_.hard_heuristic_ceiling;
    bool malicious = verdict.fused_confidence > config_.detection_threshold ||
                     over_ceiling ||
                     (verdict.classifier_confidence > config_.ml_soft_floor &&
                      verdict.heuristic_score > config_.heuristic_soft_floor);

    if (IsBenignLabel(label) && !over_ceiling) {
        malicious = false;
    }

    verdict.is_malicious = malicious;
    return verdict;
}

Severity FusionEngine::Classify(const Verdict& verdict) const {
    if (verdict.fused_confidence >= CRITICAL_FUSED_CONFIDENCE ||
        verdict.heuristic_score > config_.hard_heuristic_ceiling) {
        return Severity::CRITICAL;
    }
    return Severity::HIGH;
}

} // namespace ward
