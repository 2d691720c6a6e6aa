#pragma once
#ifndef ECORISK_PREDICTOR_CONTEXT_H
#define ECORISK_PREDICTOR_CONTEXT_H

#include "ai/collapse_trainer.h"
#include "ai/forecast_engine.h"
#include "ai/model_store.h"
#include "ai/risk_estimator.h"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ecorisk {
namespace ai {

// Owns the resident collapse model, the store handle and the estimators.
// Handlers receive it explicitly; tests build one per case with a fake store.
//
// Readers copy the model pointer under a shared lock and run inference
// without holding it. Training is serialised by train_mutex_ and publishes
// the new pair with a single pointer swap.
class PredictorContext {
public:
    PredictorContext(TrainingConfig training,
                     ForecastConfig forecast,
                     std::shared_ptr<IModelStore> store = nullptr);

    PredictorContext(const PredictorContext&) = delete;
    PredictorContext& operator=(const PredictorContext&) = delete;

    // Installs the stored model if there is one. Returns false and stays
    // heuristic on a missing or unreadable artifact.
    bool load_resident();

    RiskResult predict_risk(const std::vector<Snapshot>& recent, int steps_ahead = 5) const;
    TrainingReport train(const std::vector<Snapshot>& history);
    ForecastResult forecast(const std::vector<Snapshot>& history, int steps = 7);

    std::shared_ptr<const CollapseModel> resident_model() const;
    bool has_resident_model() const { return resident_model() != nullptr; }
    std::vector<std::string> models_loaded() const;

    // Replaces the resident model; nullptr reverts to the heuristic
    void install(std::shared_ptr<const CollapseModel> model);

private:
    CollapseTrainer trainer_;
    PopulationForecaster forecaster_;
    HeuristicEstimator heuristic_;
    std::shared_ptr<IModelStore> store_;

    mutable std::shared_mutex model_mutex_;
    std::shared_ptr<const CollapseModel> model_;
    std::mutex train_mutex_;
};

} // namespace ai
} // namespace ecorisk

#endif // ECORISK_PREDICTOR_CONTEXT_H
