#pragma once
#ifndef ECORISK_RISK_ESTIMATOR_H
#define ECORISK_RISK_ESTIMATOR_H

#include "ai/collapse_model.h"
#include "snapshot.h"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ecorisk {
namespace ai {

struct RiskFactor {
    std::string name;
    double importance = 0.0;
};

struct RiskResult {
    bool success = true;
    std::string error;
    double risk = 0.0;
    double confidence = 0.0;
    std::vector<RiskFactor> factors;
    std::string model_version;
    int steps_ahead = 5;

    // minimal / low / moderate / high / critical
    std::string risk_level() const;

    nlohmann::json to_json() const;
    static RiskResult failure(const std::string& message);
};

// Common contract of the trained and the rule-based scorers
class IRiskEstimator {
public:
    virtual ~IRiskEstimator() = default;

    virtual RiskResult estimate(const std::vector<Snapshot>& recent, int steps_ahead) const = 0;
    virtual std::string version() const = 0;
};

// Classifier-backed estimator over the latest lookback window.
// Throws on any failure so the caller can fall back.
class TrainedEstimator : public IRiskEstimator {
public:
    static constexpr size_t kTopFactors = 5;

    explicit TrainedEstimator(std::shared_ptr<const CollapseModel> model);

    RiskResult estimate(const std::vector<Snapshot>& recent, int steps_ahead) const override;
    std::string version() const override { return CollapseModel::kVersion; }

private:
    std::shared_ptr<const CollapseModel> model_;
};

// Additive rules over the latest snapshot and the 3-point plant trend.
// Used when no model is resident and whenever trained inference fails.
class HeuristicEstimator : public IRiskEstimator {
public:
    static constexpr const char* kVersion = "heuristic";
    static constexpr double kConfidence = 0.6;

    RiskResult estimate(const std::vector<Snapshot>& recent, int steps_ahead) const override;
    std::string version() const override { return kVersion; }
};

} // namespace ai
} // namespace ecorisk

#endif // ECORISK_RISK_ESTIMATOR_H
