#pragma once
#ifndef ECORISK_FEATURE_SCALER_H
#define ECORISK_FEATURE_SCALER_H

#include "ai/feature_extractor.h"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <vector>

namespace ecorisk {
namespace ai {

// Zero-mean / unit-variance standardisation fitted on the training split.
// Columns with zero variance keep a scale of 1.
class FeatureScaler {
public:
    FeatureScaler() = default;

    void fit(const std::vector<FeatureVector>& rows);

    FeatureVector transform(const FeatureVector& x) const;
    std::vector<FeatureVector> transform(const std::vector<FeatureVector>& rows) const;

    bool is_fitted() const { return fitted_; }
    const Eigen::VectorXd& mean() const { return mean_; }
    const Eigen::VectorXd& scale() const { return scale_; }

    nlohmann::json to_json() const;
    static FeatureScaler from_json(const nlohmann::json& j);

private:
    Eigen::VectorXd mean_;
    Eigen::VectorXd scale_;
    bool fitted_ = false;
};

} // namespace ai
} // namespace ecorisk

#endif // ECORISK_FEATURE_SCALER_H
