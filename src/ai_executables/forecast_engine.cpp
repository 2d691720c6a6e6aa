#include "ai/forecast_engine.h"
#include "ai/errors.h"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace ecorisk {
namespace ai {

namespace {

// Keeps the integer conversion in range for absurd extrapolations
constexpr double kMaxPopulation = 9.0e15;

std::vector<double> tail_series(const std::vector<Snapshot>& history, size_t count,
                                double Snapshot::*field) {
    std::vector<double> out;
    out.reserve(count);
    for (size_t i = history.size() - count; i < history.size(); ++i) {
        out.push_back(history[i].*field);
    }
    return out;
}

} // namespace

// ============================================
// ForecastResult
// ============================================

nlohmann::json ForecastResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    if (!success) {
        j["error"] = error;
        return j;
    }

    j["predictions"] = nlohmann::json::array();
    for (const auto& p : predictions) {
        j["predictions"].push_back({
            {"step", p.step},
            {"plants", p.plants},
            {"herbivores", p.herbivores},
            {"carnivores", p.carnivores}
        });
    }
    j["confidence"] = confidence;
    j["trends"] = {
        {"plants", trends.plants},
        {"herbivores", trends.herbivores},
        {"carnivores", trends.carnivores}
    };
    j["forecast_horizon"] = horizon;
    return j;
}

ForecastResult ForecastResult::failure(const std::string& message) {
    ForecastResult result;
    result.success = false;
    result.error = message;
    return result;
}

// ============================================
// PopulationForecaster
// ============================================

PopulationForecaster::PopulationForecaster(ForecastConfig config)
    : config_(config),
      rng_(config.seed != 0 ? config.seed : std::random_device{}()) {}

ForecastResult PopulationForecaster::forecast(const std::vector<Snapshot>& history, int steps) {
    try {
        return project(history, steps);
    } catch (const std::exception& e) {
        std::cerr << "[Forecast] Error forecasting populations: " << e.what() << std::endl;
        return ForecastResult::failure(e.what());
    }
}

ForecastResult PopulationForecaster::project(const std::vector<Snapshot>& history, int steps) {
    if (history.size() < config_.slope_window) {
        throw InsufficientDataError("Need at least " + std::to_string(config_.slope_window) +
                                    " data points for forecasting");
    }
    if (steps < 0 || steps > config_.max_steps) {
        throw InvalidInputError("Forecast steps must be between 0 and " +
                                std::to_string(config_.max_steps) + ", got " + std::to_string(steps));
    }

    const size_t window = std::min(config_.trend_window, history.size());
    const LinearFit plants = fit_line(tail_series(history, window, &Snapshot::plants));
    const LinearFit herbivores = fit_line(tail_series(history, window, &Snapshot::herbivores));
    const LinearFit carnivores = fit_line(tail_series(history, window, &Snapshot::carnivores));

    ForecastResult result;
    result.horizon = steps;
    result.predictions.reserve(static_cast<size_t>(steps));

    const int64_t last_step = history.back().step;
    for (int s = 1; s <= steps; ++s) {
        const double x = static_cast<double>(window) + s - 1;

        ForecastPoint point;
        point.step = last_step + s;
        point.plants = perturb(plants.at(x), s);
        point.herbivores = perturb(herbivores.at(x), s);
        point.carnivores = perturb(carnivores.at(x), s);
        result.predictions.push_back(point);
    }

    result.confidence = confidence_for(steps);

    const size_t n = config_.slope_window;
    result.trends.plants = trend_label(fit_line(tail_series(history, n, &Snapshot::plants)).slope);
    result.trends.herbivores = trend_label(fit_line(tail_series(history, n, &Snapshot::herbivores)).slope);
    result.trends.carnivores = trend_label(fit_line(tail_series(history, n, &Snapshot::carnivores)).slope);
    return result;
}

LinearFit PopulationForecaster::fit_line(const std::vector<double>& values) {
    const Eigen::Index n = static_cast<Eigen::Index>(values.size());
    if (n == 0) {
        throw InsufficientDataError("Cannot fit a trend to an empty series");
    }
    if (n == 1) {
        return {0.0, values.front()};
    }

    Eigen::MatrixXd design(n, 2);
    for (Eigen::Index i = 0; i < n; ++i) {
        design(i, 0) = static_cast<double>(i);
        design(i, 1) = 1.0;
    }
    Eigen::VectorXd y = Eigen::Map<const Eigen::VectorXd>(values.data(), n);
    Eigen::VectorXd coef = design.colPivHouseholderQr().solve(y);

    return {coef(0), coef(1)};
}

std::string PopulationForecaster::trend_label(double slope) const {
    if (slope > config_.trend_threshold) return "increasing";
    if (slope < -config_.trend_threshold) return "decreasing";
    return "stable";
}

double PopulationForecaster::confidence_for(int steps) const {
    return config_.base_confidence * std::pow(config_.confidence_decay, steps);
}

int64_t PopulationForecaster::perturb(double predicted, int step) {
    double value = predicted;
    const double stddev = std::abs(config_.noise_factor * step * predicted);
    if (std::isfinite(stddev) && stddev > 0.0) {
        std::normal_distribution<double> noise(0.0, stddev);
        std::lock_guard<std::mutex> lock(rng_mutex_);
        value += noise(rng_);
    }

    if (!std::isfinite(value)) {
        return value > 0 ? static_cast<int64_t>(kMaxPopulation) : 0;
    }
    // Clamped on both sides so the integer conversion is always in range
    return static_cast<int64_t>(std::trunc(std::clamp(value, 0.0, kMaxPopulation)));
}

} // namespace ai
} // namespace ecorisk
