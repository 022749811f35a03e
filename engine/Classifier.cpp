#include "engine/Classifier.hpp"
#include "core/Logger.hpp"
#include "core/StringUtils.hpp"
#include <algorithm>

namespace ward {

ClassifierAdapter::ClassifierAdapter(std::shared_ptr<const ModelPipeline> pipeline)
    : pipeline_(std::move(pipeline)) {}

Classification ClassifierAdapter::Classify(const std::vector<std::string>& tokens) {
    invocations_++;

    if (tokens.empty()) {
        return {};
    }
    if (!pipeline_) {
        failures_++;
        LOG_WARN("Classifier invoked without a loaded pipeline");
        return {};
    }

    try {
        Prediction prediction = pipeline_->Predict(Join(tokens, " "));
        Classification result;
        result.label = prediction.label;
        result.confidence = std::clamp(prediction.probability, 0.0, 1.0);
        return result;
    } catch (const std::exception& e) {
        failures_++;
        LOG_ERROR("Classifier failed on {} tokens: {}", tokens.size(), e.what());
        return {};
    }
}

} // namespace ward
