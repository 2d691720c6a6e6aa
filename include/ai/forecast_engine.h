// file: forecast_engine.h
#pragma once
#ifndef ECORISK_FORECAST_ENGINE_H
#define ECORISK_FORECAST_ENGINE_H

#include "snapshot.h"
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ecorisk {
namespace ai {

struct ForecastConfig {
    size_t trend_window = 10;       // most recent points used for extrapolation
    size_t slope_window = 5;        // most recent points used for trend labels
    double base_confidence = 0.8;
    double confidence_decay = 0.9;  // per forecast step
    double noise_factor = 0.1;      // stddev = factor * step * predicted
    double trend_threshold = 2.0;   // |slope| above this is a trend
    int max_steps = 100000;         // upper bound on a single request's horizon
    uint32_t seed = 0;              // 0 = seed from std::random_device
};

struct ForecastPoint {
    int64_t step = 0;
    int64_t plants = 0;
    int64_t herbivores = 0;
    int64_t carnivores = 0;
};

struct SpeciesTrends {
    std::string plants = "stable";
    std::string herbivores = "stable";
    std::string carnivores = "stable";
};

struct ForecastResult {
    bool success = true;
    std::string error;
    std::vector<ForecastPoint> predictions;
    double confidence = 0.0;
    SpeciesTrends trends;
    int horizon = 0;

    nlohmann::json to_json() const;
    static ForecastResult failure(const std::string& message);
};

struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;

    double at(double x) const { return slope * x + intercept; }
};

// Per-species linear trend extrapolation with noise that grows with horizon
class PopulationForecaster {
public:
    explicit PopulationForecaster(ForecastConfig config = ForecastConfig{});

    // Never throws; failures come back as success == false
    ForecastResult forecast(const std::vector<Snapshot>& history, int steps = 7);

    // Throws InsufficientDataError / InvalidInputError
    ForecastResult project(const std::vector<Snapshot>& history, int steps);

    // Degree-1 least squares of values against 0-based index
    static LinearFit fit_line(const std::vector<double>& values);

    std::string trend_label(double slope) const;
    double confidence_for(int steps) const;

    const ForecastConfig& config() const { return config_; }

private:
    ForecastConfig config_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;

    int64_t perturb(double predicted, int step);
};

} // namespace ai
} // namespace ecorisk

#endif // ECORISK_FORECAST_ENGINE_H
