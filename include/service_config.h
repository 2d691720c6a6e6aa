#pragma once
#ifndef ECORISK_SERVICE_CONFIG_H
#define ECORISK_SERVICE_CONFIG_H

#include "ai/collapse_trainer.h"
#include "ai/forecast_engine.h"
#include <string>
#include <nlohmann/json.hpp>

namespace ecorisk {

struct ServiceConfig {
    std::string service_name = "ML Prediction Service";
    std::string model_directory = "trained_models";
    bool persist_models = true;
    size_t min_training_points = 50;
    bool verbose = false;

    ai::TrainingConfig training;
    ai::ForecastConfig forecast;

    // Defaults overridden by a JSON object; unknown keys are ignored.
    // Throws std::runtime_error on wrong value types.
    static ServiceConfig from_json(const nlohmann::json& j);

    // Empty path = defaults. ECORISK_MODEL_DIR overrides model_directory.
    static ServiceConfig load(const std::string& path);

    nlohmann::json to_json() const;
};

} // namespace ecorisk

#endif // ECORISK_SERVICE_CONFIG_H
