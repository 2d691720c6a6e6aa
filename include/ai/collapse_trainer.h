#pragma once
#ifndef ECORISK_COLLAPSE_TRAINER_H
#define ECORISK_COLLAPSE_TRAINER_H

#include "ai/collapse_model.h"
#include "snapshot.h"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ecorisk {
namespace ai {

struct TrainingConfig {
    ForestParams forest;
    double test_fraction = 0.2;
    int split_seed = 42;
    size_t min_history = 10;
    size_t min_examples = 20;
};

struct TrainingReport {
    bool success = false;
    std::string error;
    std::string model_type;
    double train_accuracy = 0.0;
    double test_accuracy = 0.0;
    size_t training_samples = 0;
    size_t feature_count = 0;

    static TrainingReport from_model(const CollapseModel& model);
    static TrainingReport failure(const std::string& message);

    nlohmann::json to_json() const;
};

// One (features, label) pair per history index i in [5, n): the window
// history[i-5, i) labelled by history[i]
struct TrainingSet {
    std::vector<FeatureVector> features;
    std::vector<float> labels;

    size_t size() const { return features.size(); }
};

class CollapseTrainer {
public:
    explicit CollapseTrainer(TrainingConfig config = TrainingConfig{});

    // Throws InsufficientDataError when history is shorter than min_history
    TrainingSet build_training_set(const std::vector<Snapshot>& history) const;

    // Windows, splits, scales and fits. Throws InsufficientDataError or
    // TrainingFailure; never touches any resident model.
    std::shared_ptr<const CollapseModel> fit(const std::vector<Snapshot>& history) const;

    const TrainingConfig& config() const { return config_; }

private:
    TrainingConfig config_;

    static double accuracy(const std::vector<double>& probabilities, const std::vector<float>& labels);
};

} // namespace ai
} // namespace ecorisk

#endif // ECORISK_COLLAPSE_TRAINER_H
