#include "ai/collapse_model.h"
#include "ai/errors.h"
#include <algorithm>
#include <ctime>

namespace ecorisk {
namespace ai {

namespace {

constexpr int kFormatVersion = 1;

} // namespace

CollapseModel::CollapseModel(CollapseClassifier classifier, FeatureScaler scaler, ModelMetrics metrics,
                             std::chrono::system_clock::time_point created_at)
    : classifier_(std::move(classifier)),
      scaler_(std::move(scaler)),
      metrics_(metrics),
      created_at_(created_at) {
    const auto& names = FeatureExtractor::feature_names();
    std::vector<double> importance = classifier_.feature_importance();

    ranked_importance_.reserve(kFeatureCount);
    for (size_t i = 0; i < kFeatureCount; ++i) {
        ranked_importance_.emplace_back(names[i], importance[i]);
    }
    // Stable so equal scores keep feature order
    std::stable_sort(ranked_importance_.begin(), ranked_importance_.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
}

double CollapseModel::collapse_probability(const FeatureVector& features) const {
    return classifier_.predict_probability(scaler_.transform(features));
}

nlohmann::json CollapseModel::to_json() const {
    nlohmann::json j;
    j["format_version"] = kFormatVersion;
    j["model_type"] = kModelType;
    j["model_version"] = kVersion;
    j["created_at"] = std::chrono::system_clock::to_time_t(created_at_);

    j["metrics"] = nlohmann::json::object({
        {"train_accuracy", metrics_.train_accuracy},
        {"test_accuracy", metrics_.test_accuracy},
        {"training_samples", metrics_.training_samples},
        {"test_samples", metrics_.test_samples}
    });

    const auto& names = FeatureExtractor::feature_names();
    j["features"] = std::vector<std::string>(names.begin(), names.end());
    j["scaler"] = scaler_.to_json();
    j["classifier"] = classifier_.to_model_string();
    return j;
}

std::shared_ptr<const CollapseModel> CollapseModel::from_json(const nlohmann::json& j) {
    try {
        int version = j.at("format_version").get<int>();
        if (version != kFormatVersion) {
            throw ModelStoreError("Unsupported model format version: " + std::to_string(version));
        }
        if (j.at("model_type").get<std::string>() != kModelType) {
            throw ModelStoreError("Stored artifact is not a collapse predictor");
        }

        auto names = j.at("features").get<std::vector<std::string>>();
        const auto& expected = FeatureExtractor::feature_names();
        if (!std::equal(names.begin(), names.end(), expected.begin(), expected.end())) {
            throw ModelStoreError("Stored feature schema does not match this build");
        }

        ModelMetrics metrics;
        const auto& m = j.at("metrics");
        metrics.train_accuracy = m.value("train_accuracy", 0.0);
        metrics.test_accuracy = m.value("test_accuracy", 0.0);
        metrics.training_samples = m.value("training_samples", static_cast<size_t>(0));
        metrics.test_samples = m.value("test_samples", static_cast<size_t>(0));

        auto created_at = std::chrono::system_clock::from_time_t(j.at("created_at").get<std::time_t>());

        FeatureScaler scaler = FeatureScaler::from_json(j.at("scaler"));
        CollapseClassifier classifier =
            CollapseClassifier::from_model_string(j.at("classifier").get<std::string>());

        return std::make_shared<CollapseModel>(std::move(classifier), std::move(scaler),
                                               metrics, created_at);
    } catch (const nlohmann::json::exception& e) {
        throw ModelStoreError(std::string("Malformed model artifact: ") + e.what());
    }
}

} // namespace ai
} // namespace ecorisk
