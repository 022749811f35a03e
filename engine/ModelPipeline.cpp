#include "engine/ModelPipeline.hpp"
#include "core/Logger.hpp"
#include "core/StringUtils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace ward {

namespace {

constexpr const char* DEFAULT_TOKEN_PATTERN = "\\b\\w\\w+\\b";

std::vector<double> ReadVector(const nlohmann::json& node, const std::string& name) {
    if (!node.is_array()) {
        throw PipelineError("'" + name + "' must be an array of numbers");
    }
    std::vector<double> values;
    values.reserve(node.size());
    for (const auto& v : node) {
        if (!v.is_number()) {
            throw PipelineError("'" + name + "' contains a non-numeric value");
        }
        values.push_back(v.get<double>());
    }
    return values;
}

std::vector<std::vector<double>> ReadMatrix(const nlohmann::json& node, const std::string& name) {
    if (!node.is_array() || node.empty()) {
        throw PipelineError("'" + name + "' must be a non-empty array of rows");
    }
    std::vector<std::vector<double>> rows;
    rows.reserve(node.size());
    for (const auto& row : node) {
        rows.push_back(ReadVector(row, name));
    }
    size_t width = rows.front().size();
    for (const auto& row : rows) {
        if (row.size() != width) {
            throw PipelineError("'" + name + "' rows have inconsistent widths");
        }
    }
    return rows;
}

void RequireDimension(size_t actual, size_t expected, const std::string& what) {
    if (actual != expected) {
        throw PipelineError(what + " has dimension " + std::to_string(actual) +
                            ", expected " + std::to_string(expected));
    }
}

double Dot(const std::vector<double>& a, const std::vector<double>& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

} // namespace

std::unique_ptr<LinearModelPipeline> LinearModelPipeline::LoadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PipelineError("Cannot open pipeline artifact: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto pipeline = LoadFromString(buffer.str());
    LOG_INFO("Loaded classifier pipeline from {} ({} classes, input dimension {})",
             path, pipeline->classes_.size(), pipeline->InputDimension());
    return pipeline;
}

std::unique_ptr<LinearModelPipeline> LinearModelPipeline::LoadFromString(const std::string& json_text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        throw PipelineError(std::string("Malformed pipeline artifact: ") + e.what());
    }

    if (!root.is_object()) {
        throw PipelineError("Pipeline artifact must be a JSON object");
    }

    std::unique_ptr<LinearModelPipeline> pipeline(new LinearModelPipeline());

    try {
        size_t dimension = 1; // without a vectorizer the only feature is the token count

        if (root.contains("vectorizer")) {
            const auto& v = root["vectorizer"];
            Vectorizer vec;

            if (!v.contains("vocabulary") || !v["vocabulary"].is_object() || v["vocabulary"].empty()) {
                throw PipelineError("vectorizer.vocabulary must be a non-empty object");
            }
            for (const auto& [term, index] : v["vocabulary"].items()) {
                if (!index.is_number_unsigned()) {
                    throw PipelineError("vectorizer.vocabulary index for '" + term + "' is not an unsigned integer");
                }
                size_t idx = index.get<size_t>();
                vec.vocabulary[term] = idx;
                vec.dimension = std::max(vec.dimension, idx + 1);
            }
            if (v.contains("n_features")) {
                size_t declared = v["n_features"].get<size_t>();
                if (declared < vec.dimension) {
                    throw PipelineError("vectorizer.n_features is smaller than the vocabulary");
                }
                vec.dimension = declared;
            }

            if (v.contains("idf")) {
                vec.idf = ReadVector(v["idf"], "vectorizer.idf");
                RequireDimension(vec.idf.size(), vec.dimension, "vectorizer.idf");
            }

            vec.lowercase = v.value("lowercase", true);
            vec.sublinear_tf = v.value("sublinear_tf", false);

            std::string analyzer = v.value("analyzer", std::string("word"));
            if (analyzer == "whitespace") {
                vec.whitespace_analyzer = true;
            } else if (analyzer != "word") {
                throw PipelineError("Unsupported vectorizer.analyzer: " + analyzer);
            }

            std::string pattern = v.value("token_pattern", std::string(DEFAULT_TOKEN_PATTERN));
            try {
                vec.token_pattern = std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
            } catch (const std::regex_error& e) {
                throw PipelineError("Invalid vectorizer.token_pattern '" + pattern + "': " + e.what());
            }

            if (v.contains("ngram_range")) {
                const auto& range = v["ngram_range"];
                if (!range.is_array() || range.size() != 2) {
                    throw PipelineError("vectorizer.ngram_range must be [min, max]");
                }
                vec.ngram_min = range[0].get<size_t>();
                vec.ngram_max = range[1].get<size_t>();
                if (vec.ngram_min == 0 || vec.ngram_min > vec.ngram_max) {
                    throw PipelineError("vectorizer.ngram_range is invalid");
                }
            }

            std::string norm = v.value("norm", std::string("l2"));
            if (norm == "none") {
                vec.l2_norm = false;
            } else if (norm != "l2") {
                throw PipelineError("Unsupported vectorizer.norm: " + norm);
            }

            dimension = vec.dimension;
            pipeline->vectorizer_ = std::move(vec);
        }

        if (root.contains("selector")) {
            const auto& indices_node = root["selector"].at("indices");
            if (!indices_node.is_array() || indices_node.empty()) {
                throw PipelineError("selector.indices must be a non-empty array");
            }
            std::vector<size_t> indices;
            for (const auto& idx : indices_node) {
                size_t i = idx.get<size_t>();
                if (i >= dimension) {
                    throw PipelineError("selector index " + std::to_string(i) +
                                        " out of range for dimension " + std::to_string(dimension));
                }
                indices.push_back(i);
            }
            dimension = indices.size();
            pipeline->selector_ = std::move(indices);
        }

        if (root.contains("scaler")) {
            const auto& s = root["scaler"];
            Scaler scaler;
            scaler.mean = s.contains("mean") ? ReadVector(s["mean"], "scaler.mean")
                                             : std::vector<double>(dimension, 0.0);
            scaler.scale = s.contains("scale") ? ReadVector(s["scale"], "scaler.scale")
                                               : std::vector<double>(dimension, 1.0);
            RequireDimension(scaler.mean.size(), dimension, "scaler.mean");
            RequireDimension(scaler.scale.size(), dimension, "scaler.scale");
            for (double& value : scaler.scale) {
                if (value == 0.0) {
                    value = 1.0;
                }
            }
            pipeline->scaler_ = std::move(scaler);
        }

        if (root.contains("pca")) {
            const auto& p = root["pca"];
            Pca pca;
            pca.components = ReadMatrix(p.at("components"), "pca.components");
            RequireDimension(pca.components.front().size(), dimension, "pca.components");
            pca.mean = p.contains("mean") ? ReadVector(p["mean"], "pca.mean")
                                          : std::vector<double>(dimension, 0.0);
            RequireDimension(pca.mean.size(), dimension, "pca.mean");
            dimension = pca.components.size();
            pipeline->pca_ = std::move(pca);
        }

        if (!root.contains("model")) {
            throw PipelineError("Pipeline artifact has no 'model' stage");
        }
        const auto& m = root["model"];
        for (const auto& label : m.at("classes")) {
            pipeline->classes_.push_back(label.is_string() ? label.get<std::string>() : label.dump());
        }
        pipeline->coef_ = ReadMatrix(m.at("coef"), "model.coef");
        pipeline->intercept_ = ReadVector(m.at("intercept"), "model.intercept");

        RequireDimension(pipeline->coef_.front().size(), dimension, "model.coef");
        RequireDimension(pipeline->intercept_.size(), pipeline->coef_.size(), "model.intercept");

        size_t rows = pipeline->coef_.size();
        if (rows == 1) {
            RequireDimension(pipeline->classes_.size(), 2, "model.classes (binary)");
        } else {
            RequireDimension(pipeline->classes_.size(), rows, "model.classes");
        }
    } catch (const nlohmann::json::exception& e) {
        throw PipelineError(std::string("Invalid pipeline artifact: ") + e.what());
    }

    return pipeline;
}

size_t LinearModelPipeline::InputDimension() const {
    return vectorizer_ ? vectorizer_->dimension : 1;
}

std::vector<std::string> LinearModelPipeline::Analyze(const std::string& document) const {
    const Vectorizer& vec = *vectorizer_;
    std::string text = vec.lowercase ? ToLower(document) : document;

    std::vector<std::string> words;
    if (vec.whitespace_analyzer) {
        std::istringstream stream(text);
        std::string word;
        while (stream >> word) {
            words.push_back(word);
        }
    } else {
        auto begin = std::sregex_iterator(text.begin(), text.end(), vec.token_pattern);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            words.push_back(it->str());
        }
    }

    if (vec.ngram_min == 1 && vec.ngram_max == 1) {
        return words;
    }

    std::vector<std::string> terms;
    for (size_t n = vec.ngram_min; n <= vec.ngram_max; ++n) {
        if (words.size() < n) {
            break;
        }
        for (size_t i = 0; i + n <= words.size(); ++i) {
            std::string gram = words[i];
            for (size_t j = 1; j < n; ++j) {
                gram += ' ';
                gram += words[i + j];
            }
            terms.push_back(std::move(gram));
        }
    }
    return terms;
}

std::vector<double> LinearModelPipeline::Vectorize(const std::string& document) const {
    if (!vectorizer_) {
        std::istringstream stream(document);
        std::string word;
        double count = 0.0;
        while (stream >> word) {
            count += 1.0;
        }
        return {count};
    }

    const Vectorizer& vec = *vectorizer_;
    std::vector<double> features(vec.dimension, 0.0);

    for (const auto& term : Analyze(document)) {
        auto it = vec.vocabulary.find(term);
        if (it != vec.vocabulary.end()) {
            features[it->second] += 1.0;
        }
    }

    for (size_t i = 0; i < features.size(); ++i) {
        if (features[i] == 0.0) {
            continue;
        }
        if (vec.sublinear_tf) {
            features[i] = 1.0 + std::log(features[i]);
        }
        if (!vec.idf.empty()) {
            features[i] *= vec.idf[i];
        }
    }

    if (vec.l2_norm) {
        double norm = std::sqrt(Dot(features, features));
        if (norm > 0.0) {
            for (double& value : features) {
                value /= norm;
            }
        }
    }
    return features;
}

Prediction LinearModelPipeline::Predict(const std::string& document) const {
    std::vector<double> x = Vectorize(document);

    if (selector_) {
        std::vector<double> selected;
        selected.reserve(selector_->size());
        for (size_t idx : *selector_) {
            selected.push_back(x.at(idx));
        }
        x = std::move(selected);
    }

    if (scaler_) {
        for (size_t i = 0; i < x.size(); ++i) {
            x[i] = (x[i] - scaler_->mean[i]) / scaler_->scale[i];
        }
    }

    if (pca_) {
        std::vector<double> centered(x.size());
        for (size_t i = 0; i < x.size(); ++i) {
            centered[i] = x[i] - pca_->mean[i];
        }
        std::vector<double> projected;
        projected.reserve(pca_->components.size());
        for (const auto& component : pca_->components) {
            projected.push_back(Dot(component, centered));
        }
        x = std::move(projected);
    }

    if (x.size() != coef_.front().size()) {
        throw PipelineError("Feature vector dimension " + std::to_string(x.size()) +
                            " does not match model input " + std::to_string(coef_.front().size()));
    }

    Prediction prediction;
    if (coef_.size() == 1) {
        double z = Dot(coef_[0], x) + intercept_[0];
        double positive = 1.0 / (1.0 + std::exp(-z));
        prediction.probabilities = {1.0 - positive, positive};
    } else {
        std::vector<double> scores;
        scores.reserve(coef_.size());
        for (size_t row = 0; row < coef_.size(); ++row) {
            scores.push_back(Dot(coef_[row], x) + intercept_[row]);
        }
        double max_score = *std::max_element(scores.begin(), scores.end());
        double total = 0.0;
        for (double& s : scores) {
            s = std::exp(s - max_score);
            total += s;
        }
        for (double& s : scores) {
            s /= total;
        }
        prediction.probabilities = std::move(scores);
    }

    auto best = std::max_element(prediction.probabilities.begin(), prediction.probabilities.end());
    size_t index = static_cast<size_t>(std::distance(prediction.probabilities.begin(), best));
    prediction.label = classes_[index];
    prediction.probability = *best;
    return prediction;
}

} // namespace ward
