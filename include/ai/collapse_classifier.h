#pragma once
#ifndef ECORISK_COLLAPSE_CLASSIFIER_H
#define ECORISK_COLLAPSE_CLASSIFIER_H

#include "ai/feature_extractor.h"
#include <LightGBM/c_api.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace ecorisk {
namespace ai {

// Random forest hyperparameters
struct ForestParams {
    int num_trees = 100;
    int max_depth = 10;
    int min_samples_split = 5;
    double bagging_fraction = 0.632;
    int seed = 42;
    int num_threads = 1;
    bool verbose = false;

    std::unordered_map<std::string, std::string> to_lightgbm() const;
};

// LightGBM random forest over the collapse feature vector. Owns the booster
// handle; move-only.
class CollapseClassifier {
public:
    CollapseClassifier() = default;
    ~CollapseClassifier();

    CollapseClassifier(CollapseClassifier&& other) noexcept;
    CollapseClassifier& operator=(CollapseClassifier&& other) noexcept;
    CollapseClassifier(const CollapseClassifier&) = delete;
    CollapseClassifier& operator=(const CollapseClassifier&) = delete;

    // Throws TrainingFailure
    void fit(const std::vector<FeatureVector>& features,
             const std::vector<float>& labels,
             const ForestParams& params = ForestParams{});

    // Probability of the collapse class for one scaled row. Throws InferenceFailure.
    double predict_probability(const FeatureVector& scaled) const;
    std::vector<double> predict_probabilities(const std::vector<FeatureVector>& scaled) const;

    // Gain importance per feature, normalised to sum to 1
    std::vector<double> feature_importance() const;

    std::string to_model_string() const;
    static CollapseClassifier from_model_string(const std::string& model_text);

    bool is_trained() const { return booster_ != nullptr; }
    int num_iterations() const { return num_iterations_; }

private:
    BoosterHandle booster_ = nullptr;
    int num_iterations_ = 0;

    void release();
    static std::string generate_parameters(const std::unordered_map<std::string, std::string>& params);
};

} // namespace ai
} // namespace ecorisk

#endif // ECORISK_COLLAPSE_CLASSIFIER_H
