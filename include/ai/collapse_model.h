#pragma once
#ifndef ECORISK_COLLAPSE_MODEL_H
#define ECORISK_COLLAPSE_MODEL_H

#include "ai/collapse_classifier.h"
#include "ai/feature_scaler.h"
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace ecorisk {
namespace ai {

struct ModelMetrics {
    double train_accuracy = 0.0;
    double test_accuracy = 0.0;
    size_t training_samples = 0;
    size_t test_samples = 0;
};

// The classifier and the scaler fitted with it, held as one immutable unit.
// Published through std::shared_ptr<const CollapseModel> and replaced whole.
class CollapseModel {
public:
    static constexpr const char* kModelType = "collapse_predictor";
    static constexpr const char* kVersion = "1.0";

    CollapseModel(CollapseClassifier classifier, FeatureScaler scaler, ModelMetrics metrics,
                  std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now());

    const CollapseClassifier& classifier() const { return classifier_; }
    const FeatureScaler& scaler() const { return scaler_; }
    const ModelMetrics& metrics() const { return metrics_; }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }

    // Feature names paired with normalised importance, most important first
    const std::vector<std::pair<std::string, double>>& ranked_importance() const { return ranked_importance_; }

    // Scales the features and returns P(collapse). Throws InferenceFailure.
    double collapse_probability(const FeatureVector& features) const;

    nlohmann::json to_json() const;
    static std::shared_ptr<const CollapseModel> from_json(const nlohmann::json& j);

private:
    CollapseClassifier classifier_;
    FeatureScaler scaler_;
    ModelMetrics metrics_;
    std::chrono::system_clock::time_point created_at_;
    std::vector<std::pair<std::string, double>> ranked_importance_;
};

} // namespace ai
} // namespace ecorisk

#endif // ECORISK_COLLAPSE_MODEL_H
