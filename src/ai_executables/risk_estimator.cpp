#include "ai/risk_estimator.h"
#include "ai/errors.h"
#include "ai/feature_extractor.h"
#include <algorithm>

namespace ecorisk {
namespace ai {

// ============================================
// RiskResult
// ============================================

std::string RiskResult::risk_level() const {
    if (risk > 0.8) return "critical";
    if (risk > 0.6) return "high";
    if (risk > 0.4) return "moderate";
    if (risk > 0.2) return "low";
    return "minimal";
}

nlohmann::json RiskResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    if (!success) {
        j["error"] = error;
        return j;
    }

    j["risk"] = risk;
    j["confidence"] = confidence;
    j["factors"] = nlohmann::json::array();
    for (const auto& factor : factors) {
        j["factors"].push_back({{"factor", factor.name}, {"importance", factor.importance}});
    }
    j["model_version"] = model_version;
    j["risk_level"] = risk_level();
    j["steps_ahead"] = steps_ahead;
    return j;
}

RiskResult RiskResult::failure(const std::string& message) {
    RiskResult result;
    result.success = false;
    result.error = message;
    return result;
}

// ============================================
// TrainedEstimator
// ============================================

TrainedEstimator::TrainedEstimator(std::shared_ptr<const CollapseModel> model)
    : model_(std::move(model)) {}

RiskResult TrainedEstimator::estimate(const std::vector<Snapshot>& recent, int steps_ahead) const {
    if (!model_) {
        throw InferenceFailure("No trained collapse model");
    }

    FeatureVector features = FeatureExtractor::extract_latest(recent);
    double p = model_->collapse_probability(features);

    RiskResult result;
    result.risk = p;
    result.confidence = std::max(p, 1.0 - p);
    result.model_version = version();
    result.steps_ahead = steps_ahead;

    const auto& ranked = model_->ranked_importance();
    size_t top = std::min(kTopFactors, ranked.size());
    result.factors.reserve(top);
    for (size_t i = 0; i < top; ++i) {
        result.factors.push_back({ranked[i].first, ranked[i].second});
    }
    return result;
}

// ============================================
// HeuristicEstimator
// ============================================

RiskResult HeuristicEstimator::estimate(const std::vector<Snapshot>& recent, int steps_ahead) const {
    if (recent.empty()) {
        throw InvalidInputError("No data provided");
    }

    const Snapshot& latest = recent.back();
    RiskResult result;
    result.model_version = version();
    result.confidence = kConfidence;
    result.steps_ahead = steps_ahead;

    double risk = 0.0;
    auto trigger = [&](const char* name, double weight) {
        risk += weight;
        result.factors.push_back({name, weight});
    };

    if (latest.plants < 10) {
        trigger("critically_low_plants", 0.4);
    } else if (latest.plants < 30) {
        trigger("low_plants", 0.2);
    }

    if (latest.herbivores < 3) {
        trigger("critically_low_herbivores", 0.3);
    }

    if (latest.carnivores > latest.herbivores * 1.5) {
        trigger("predator_overload", 0.2);
    }

    if (recent.size() >= 3) {
        const Snapshot& first = recent[recent.size() - 3];
        double plant_trend = (latest.plants - first.plants) / 3.0;
        if (plant_trend < -5) {
            trigger("declining_plant_trend", 0.15);
        }
    }

    result.risk = std::clamp(risk, 0.0, 1.0);
    return result;
}

} // namespace ai
} // namespace ecorisk
