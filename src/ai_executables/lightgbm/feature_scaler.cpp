#include "ai/feature_scaler.h"
#include "ai/errors.h"
#include <string>

namespace ecorisk {
namespace ai {

void FeatureScaler::fit(const std::vector<FeatureVector>& rows) {
    if (rows.empty()) {
        throw TrainingFailure("Cannot fit scaler on an empty sample");
    }

    const Eigen::Index n = static_cast<Eigen::Index>(rows.size());
    const Eigen::Index d = static_cast<Eigen::Index>(kFeatureCount);

    Eigen::MatrixXd x(n, d);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index k = 0; k < d; ++k) {
            x(i, k) = rows[static_cast<size_t>(i)][static_cast<size_t>(k)];
        }
    }

    mean_ = x.colwise().mean().transpose();
    Eigen::MatrixXd centered = x.rowwise() - mean_.transpose();
    Eigen::VectorXd variance = centered.array().square().colwise().sum().transpose() /
                               static_cast<double>(n);
    scale_ = variance.array().sqrt();

    for (Eigen::Index k = 0; k < d; ++k) {
        if (scale_(k) == 0.0) {
            scale_(k) = 1.0;
        }
    }
    fitted_ = true;
}

FeatureVector FeatureScaler::transform(const FeatureVector& x) const {
    if (!fitted_) {
        throw InferenceFailure("Feature scaler has not been fitted");
    }
    if (mean_.size() != static_cast<Eigen::Index>(kFeatureCount) ||
        scale_.size() != static_cast<Eigen::Index>(kFeatureCount)) {
        throw InferenceFailure("Feature scaler expects " + std::to_string(mean_.size()) +
                               " features, got " + std::to_string(kFeatureCount));
    }

    FeatureVector out;
    for (size_t k = 0; k < kFeatureCount; ++k) {
        const Eigen::Index i = static_cast<Eigen::Index>(k);
        out[k] = (x[k] - mean_(i)) / scale_(i);
    }
    return out;
}

std::vector<FeatureVector> FeatureScaler::transform(const std::vector<FeatureVector>& rows) const {
    std::vector<FeatureVector> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(transform(row));
    }
    return out;
}

nlohmann::json FeatureScaler::to_json() const {
    nlohmann::json j;
    j["mean"] = std::vector<double>(mean_.data(), mean_.data() + mean_.size());
    j["scale"] = std::vector<double>(scale_.data(), scale_.data() + scale_.size());
    return j;
}

FeatureScaler FeatureScaler::from_json(const nlohmann::json& j) {
    auto mean = j.at("mean").get<std::vector<double>>();
    auto scale = j.at("scale").get<std::vector<double>>();
    if (mean.size() != kFeatureCount || scale.size() != kFeatureCount) {
        throw ModelStoreError("Stored scaler has " + std::to_string(mean.size()) +
                              " features, expected " + std::to_string(kFeatureCount));
    }

    FeatureScaler scaler;
    scaler.mean_ = Eigen::Map<const Eigen::VectorXd>(mean.data(), static_cast<Eigen::Index>(mean.size()));
    scaler.scale_ = Eigen::Map<const Eigen::VectorXd>(scale.data(), static_cast<Eigen::Index>(scale.size()));
    scaler.fitted_ = true;
    return scaler;
}

} // namespace ai
} // namespace ecorisk
