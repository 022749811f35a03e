#pragma once

#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace ward {

class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message) : std::runtime_error(message) {}
};

struct Prediction {
    std::string label;
    double probability{0.0};
    std::vector<double> probabilities;
};

// A trained text classification pipeline: document in, class probabilities out.
class ModelPipeline {
public:
    virtual ~ModelPipeline() = default;

    // Throws PipelineError (or another std::exception) when the document cannot
    // be scored.
    virtual Prediction Predict(const std::string& document) const = 0;
    virtual const std::vector<std::string>& Classes() const = 0;
};

// Pipeline exported to JSON:
//   vectorizer (TF-IDF) -> selector -> scaler -> pca -> linear model
// Every stage but the model is optional. Dimensions are checked at load time.
class LinearModelPipeline : public ModelPipeline {
public:
    static std::unique_ptr<LinearModelPipeline> LoadFromFile(const std::string& path);
    static std::unique_ptr<LinearModelPipeline> LoadFromString(const std::string& json_text);

    Prediction Predict(const std::string& document) const override;
    const std::vector<std::string>& Classes() const override { return classes_; }

    size_t InputDimension() const;
    bool HasVectorizer() const { return vectorizer_.has_value(); }

private:
    struct Vectorizer {
        std::unordered_map<std::string, size_t> vocabulary;
        std::vector<double> idf;
        bool lowercase{true};
        bool whitespace_analyzer{false};
        std::regex token_pattern;
        size_t ngram_min{1};
        size_t ngram_max{1};
        bool sublinear_tf{false};
        bool l2_norm{true};
        size_t dimension{0};
    };

    struct Scaler {
        std::vector<double> mean;
        std::vector<double> scale;
    };

    struct Pca {
        std::vector<double> mean;
        std::vector<std::vector<double>> components;
    };

    LinearModelPipeline() = default;

    std::vector<double> Vectorize(const std::string& document) const;
    std::vector<std::string> Analyze(const std::string& document) const;

    std::optional<Vectorizer> vectorizer_;
    std::optional<std::vector<size_t>> selector_;
    std::optional<Scaler> scaler_;
    std::optional<Pca> pca_;

    std::vector<std::string> classes_;
    std::vector<std::vector<double>> coef_;
    std::vector<double> intercept_;
};

} // namespace ward
