#pragma once

#include "engine/ModelPipeline.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ward {

struct Classification {
    std::optional<std::string> label;
    double confidence{0.0};
};

class Classifier {
public:
    virtual ~Classifier() = default;

    // Never throws. No label and zero confidence mean "no ML signal".
    virtual Classification Classify(const std::vector<std::string>& tokens) = 0;
};

// Adapts a ModelPipeline to the Classifier interface: tokens are joined with
// single spaces and the argmax class is reported with its probability.
class ClassifierAdapter : public Classifier {
public:
    explicit ClassifierAdapter(std::shared_ptr<const ModelPipeline> pipeline);

    Classification Classify(const std::vector<std::string>& tokens) override;

    uint64_t GetInvocationCount() const { return invocations_.load(); }
    uint64_t GetFailureCount() const { return failures_.load(); }

private:
    std::shared_ptr<const ModelPipeline> pipeline_;
    std::atomic<uint64_t> invocations_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace ward
