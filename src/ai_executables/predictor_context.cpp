#include "ai/predictor_context.h"
#include "ai/errors.h"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ecorisk {
namespace ai {

PredictorContext::PredictorContext(TrainingConfig training,
                                   ForecastConfig forecast,
                                   std::shared_ptr<IModelStore> store)
    : trainer_(std::move(training)),
      forecaster_(forecast),
      store_(std::move(store)) {}

bool PredictorContext::load_resident() {
    if (!store_) {
        return false;
    }

    try {
        auto model = store_->load();
        if (!model) {
            return false;
        }
        install(std::move(model));
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Predictor] Error loading models: " << e.what() << std::endl;
        return false;
    }
}

std::shared_ptr<const CollapseModel> PredictorContext::resident_model() const {
    std::shared_lock lock(model_mutex_);
    return model_;
}

void PredictorContext::install(std::shared_ptr<const CollapseModel> model) {
    std::unique_lock lock(model_mutex_);
    model_ = std::move(model);
}

std::vector<std::string> PredictorContext::models_loaded() const {
    std::vector<std::string> names;
    if (has_resident_model()) {
        names.push_back("collapse");
    }
    return names;
}

RiskResult PredictorContext::predict_risk(const std::vector<Snapshot>& recent, int steps_ahead) const {
    auto model = resident_model();
    if (model) {
        try {
            TrainedEstimator trained(std::move(model));
            return trained.estimate(recent, steps_ahead);
        } catch (const std::exception& e) {
            std::cerr << "[Predictor] Error predicting collapse risk: " << e.what() << std::endl;
        }
    }

    try {
        return heuristic_.estimate(recent, steps_ahead);
    } catch (const std::exception& e) {
        return RiskResult::failure(e.what());
    }
}

TrainingReport PredictorContext::train(const std::vector<Snapshot>& history) {
    std::lock_guard<std::mutex> lock(train_mutex_);
    std::cout << "[Trainer] Training collapse prediction model on " << history.size()
              << " snapshots..." << std::endl;

    try {
        auto model = trainer_.fit(history);

        // Persist before publishing so a failed save leaves the resident model in place
        if (store_) {
            store_->save(*model);
        }

        TrainingReport report = TrainingReport::from_model(*model);
        install(std::move(model));

        std::ostringstream msg;
        msg << std::fixed << std::setprecision(3)
            << "[Trainer] Collapse model trained - Train accuracy: " << report.train_accuracy
            << ", Test accuracy: " << report.test_accuracy;
        std::cout << msg.str() << std::endl;
        return report;
    } catch (const std::exception& e) {
        std::cerr << "[Trainer] Error training collapse model: " << e.what() << std::endl;
        return TrainingReport::failure(e.what());
    }
}

ForecastResult PredictorContext::forecast(const std::vector<Snapshot>& history, int steps) {
    return forecaster_.forecast(history, steps);
}

} // namespace ai
} // namespace ecorisk
