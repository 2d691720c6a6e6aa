#include "ai/collapse_trainer.h"
#include "ai/collapse_label.h"
#include "ai/errors.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <random>

namespace ecorisk {
namespace ai {

// ============================================
// TrainingReport
// ============================================

TrainingReport TrainingReport::from_model(const CollapseModel& model) {
    TrainingReport report;
    report.success = true;
    report.model_type = CollapseModel::kModelType;
    report.train_accuracy = model.metrics().train_accuracy;
    report.test_accuracy = model.metrics().test_accuracy;
    report.training_samples = model.metrics().training_samples;
    report.feature_count = kFeatureCount;
    return report;
}

TrainingReport TrainingReport::failure(const std::string& message) {
    TrainingReport report;
    report.success = false;
    report.error = message;
    return report;
}

nlohmann::json TrainingReport::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    if (!success) {
        j["error"] = error;
        return j;
    }
    j["model_type"] = model_type;
    j["train_accuracy"] = train_accuracy;
    j["test_accuracy"] = test_accuracy;
    j["training_samples"] = training_samples;
    j["feature_count"] = feature_count;
    return j;
}

// ============================================
// CollapseTrainer
// ============================================

CollapseTrainer::CollapseTrainer(TrainingConfig config)
    : config_(std::move(config)) {}

TrainingSet CollapseTrainer::build_training_set(const std::vector<Snapshot>& history) const {
    if (history.size() < config_.min_history) {
        throw InsufficientDataError("Insufficient data for prediction (need at least " +
                                    std::to_string(config_.min_history) + " data points)");
    }

    TrainingSet set;
    set.features.reserve(history.size() - kLookbackWindow);
    set.labels.reserve(history.size() - kLookbackWindow);
    for (size_t i = kLookbackWindow; i < history.size(); ++i) {
        set.features.push_back(FeatureExtractor::extract_at(history, i));
        set.labels.push_back(collapse_label(history[i]));
    }
    return set;
}

std::shared_ptr<const CollapseModel> CollapseTrainer::fit(const std::vector<Snapshot>& history) const {
    TrainingSet set = build_training_set(history);

    // The message is historical; the check is on usable windows
    if (set.size() < config_.min_examples) {
        throw InsufficientDataError("Insufficient training data (need at least 30 data points)");
    }

    const size_t n = set.size();
    const size_t n_test = static_cast<size_t>(std::ceil(config_.test_fraction * static_cast<double>(n)));
    if (n_test == 0 || n_test >= n) {
        throw TrainingFailure("Test fraction " + std::to_string(config_.test_fraction) +
                              " leaves an empty split for " + std::to_string(n) + " samples");
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(static_cast<std::mt19937::result_type>(config_.split_seed));
    std::shuffle(order.begin(), order.end(), rng);

    std::vector<FeatureVector> x_train, x_test;
    std::vector<float> y_train, y_test;
    x_train.reserve(n - n_test);
    y_train.reserve(n - n_test);
    x_test.reserve(n_test);
    y_test.reserve(n_test);
    for (size_t k = 0; k < n; ++k) {
        size_t idx = order[k];
        if (k < n_test) {
            x_test.push_back(set.features[idx]);
            y_test.push_back(set.labels[idx]);
        } else {
            x_train.push_back(set.features[idx]);
            y_train.push_back(set.labels[idx]);
        }
    }

    FeatureScaler scaler;
    scaler.fit(x_train);
    std::vector<FeatureVector> x_train_scaled = scaler.transform(x_train);
    std::vector<FeatureVector> x_test_scaled = scaler.transform(x_test);

    if (config_.forest.verbose) {
        size_t positives = static_cast<size_t>(std::count(set.labels.begin(), set.labels.end(), 1.0f));
        std::cout << "[Trainer] " << n << " windows (" << positives << " collapse), "
                  << x_train.size() << " train / " << x_test.size() << " test" << std::endl;
    }

    CollapseClassifier classifier;
    classifier.fit(x_train_scaled, y_train, config_.forest);

    ModelMetrics metrics;
    try {
        metrics.train_accuracy = accuracy(classifier.predict_probabilities(x_train_scaled), y_train);
        metrics.test_accuracy = accuracy(classifier.predict_probabilities(x_test_scaled), y_test);
    } catch (const InferenceFailure& e) {
        throw TrainingFailure(std::string("Evaluation after fit failed: ") + e.what());
    }
    metrics.training_samples = x_train.size();
    metrics.test_samples = x_test.size();

    return std::make_shared<CollapseModel>(std::move(classifier), std::move(scaler), metrics);
}

double CollapseTrainer::accuracy(const std::vector<double>& probabilities, const std::vector<float>& labels) {
    if (labels.empty()) {
        return 0.0;
    }

    size_t correct = 0;
    for (size_t i = 0; i < labels.size(); ++i) {
        float predicted = probabilities[i] > 0.5 ? 1.0f : 0.0f;
        if (predicted == labels[i]) {
            ++correct;
        }
    }
    return static_cast<double>(correct) / static_cast<double>(labels.size());
}

} // namespace ai
} // namespace ecorisk
