#include "ai/collapse_classifier.h"
#include "ai/errors.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <utility>

namespace ecorisk {
namespace ai {

// ============================================
// ForestParams
// ============================================

std::unordered_map<std::string, std::string> ForestParams::to_lightgbm() const {
    std::unordered_map<std::string, std::string> p;
    p["objective"] = "binary";
    p["boosting"] = "rf";
    p["num_iterations"] = std::to_string(num_trees);
    p["max_depth"] = std::to_string(max_depth);
    p["num_leaves"] = std::to_string(1 << std::min(max_depth, 16));

    // LightGBM bounds leaf size rather than parent size; two children of at
    // least half the split minimum approximate it.
    p["min_data_in_leaf"] = std::to_string(std::max(1, min_samples_split / 2));
    p["min_sum_hessian_in_leaf"] = "0.0";
    p["min_data_in_bin"] = "1";

    p["bagging_fraction"] = std::to_string(bagging_fraction);
    p["bagging_freq"] = "1";
    p["feature_fraction_bynode"] =
        std::to_string(std::sqrt(static_cast<double>(kFeatureCount)) / kFeatureCount);

    p["seed"] = std::to_string(seed);
    p["bagging_seed"] = std::to_string(seed);
    p["feature_fraction_seed"] = std::to_string(seed);
    p["data_random_seed"] = std::to_string(seed);
    p["deterministic"] = "true";
    p["num_threads"] = std::to_string(num_threads);
    p["verbosity"] = verbose ? "1" : "-1";
    return p;
}

// ============================================
// CollapseClassifier
// ============================================

CollapseClassifier::~CollapseClassifier() {
    release();
}

CollapseClassifier::CollapseClassifier(CollapseClassifier&& other) noexcept
    : booster_(other.booster_), num_iterations_(other.num_iterations_) {
    other.booster_ = nullptr;
    other.num_iterations_ = 0;
}

CollapseClassifier& CollapseClassifier::operator=(CollapseClassifier&& other) noexcept {
    if (this != &other) {
        release();
        booster_ = other.booster_;
        num_iterations_ = other.num_iterations_;
        other.booster_ = nullptr;
        other.num_iterations_ = 0;
    }
    return *this;
}

void CollapseClassifier::release() {
    if (booster_) {
        LGBM_BoosterFree(booster_);
        booster_ = nullptr;
    }
}

void CollapseClassifier::fit(const std::vector<FeatureVector>& features,
                             const std::vector<float>& labels,
                             const ForestParams& params) {
    if (features.empty() || features.size() != labels.size()) {
        throw TrainingFailure("Invalid training data: " + std::to_string(features.size()) +
                              " rows, " + std::to_string(labels.size()) + " labels");
    }

    const auto num_samples = static_cast<int32_t>(features.size());
    const auto num_features = static_cast<int32_t>(kFeatureCount);

    std::vector<double> flat;
    flat.reserve(features.size() * kFeatureCount);
    for (const auto& row : features) {
        flat.insert(flat.end(), row.begin(), row.end());
    }

    const std::string param_str = generate_parameters(params.to_lightgbm());
    if (params.verbose) {
        std::cout << "[LightGBM] Training random forest with " << num_samples << " samples, "
                  << num_features << " features" << std::endl;
        std::cout << "[LightGBM] Parameters: " << param_str << std::endl;
    }

    DatasetHandle dataset = nullptr;
    int result = LGBM_DatasetCreateFromMat(
        flat.data(),
        C_API_DTYPE_FLOAT64,
        num_samples,
        num_features,
        1, // row major
        param_str.c_str(),
        nullptr,
        &dataset
    );
    if (result != 0 || !dataset) {
        throw TrainingFailure(std::string("[LightGBM] Failed to create dataset: ") + LGBM_GetLastError());
    }

    result = LGBM_DatasetSetField(dataset, "label", labels.data(),
                                  static_cast<int>(labels.size()), C_API_DTYPE_FLOAT32);
    if (result != 0) {
        std::string err = LGBM_GetLastError();
        LGBM_DatasetFree(dataset);
        throw TrainingFailure("[LightGBM] Failed to set labels: " + err);
    }

    const auto& names = FeatureExtractor::feature_names();
    std::vector<const char*> name_ptrs;
    name_ptrs.reserve(names.size());
    for (const auto& name : names) {
        name_ptrs.push_back(name.c_str());
    }
    result = LGBM_DatasetSetFeatureNames(dataset, name_ptrs.data(), static_cast<int>(name_ptrs.size()));
    if (result != 0) {
        std::string err = LGBM_GetLastError();
        LGBM_DatasetFree(dataset);
        throw TrainingFailure("[LightGBM] Failed to set feature names: " + err);
    }

    BoosterHandle new_booster = nullptr;
    result = LGBM_BoosterCreate(dataset, param_str.c_str(), &new_booster);
    if (result != 0 || !new_booster) {
        std::string err = LGBM_GetLastError();
        LGBM_DatasetFree(dataset);
        throw TrainingFailure("[LightGBM] Failed to create booster: " + err);
    }

    int iterations = 0;
    for (int i = 0; i < params.num_trees; ++i) {
        int is_finished = 0;
        result = LGBM_BoosterUpdateOneIter(new_booster, &is_finished);
        if (result != 0) {
            std::string err = LGBM_GetLastError();
            LGBM_BoosterFree(new_booster);
            LGBM_DatasetFree(dataset);
            throw TrainingFailure("[LightGBM] Training iteration " + std::to_string(i + 1) +
                                  " failed: " + err);
        }
        ++iterations;
        if (is_finished) {
            break;
        }
    }

    LGBM_DatasetFree(dataset);

    release();
    booster_ = new_booster;
    num_iterations_ = iterations;
}

double CollapseClassifier::predict_probability(const FeatureVector& scaled) const {
    if (!booster_) {
        throw InferenceFailure("[LightGBM] Model not trained");
    }

    int64_t out_len = 0;
    double out_result = 0.0;
    int result = LGBM_BoosterPredictForMatSingleRow(
        booster_,
        scaled.data(),
        C_API_DTYPE_FLOAT64,
        static_cast<int>(kFeatureCount),
        1, // row major
        C_API_PREDICT_NORMAL,
        0, // start iteration
        -1, // all iterations
        "",
        &out_len,
        &out_result
    );
    if (result != 0 || out_len != 1) {
        throw InferenceFailure(std::string("[LightGBM] Prediction failed: ") + LGBM_GetLastError());
    }
    if (!std::isfinite(out_result)) {
        throw InferenceFailure("[LightGBM] Prediction is not finite");
    }
    return std::clamp(out_result, 0.0, 1.0);
}

std::vector<double> CollapseClassifier::predict_probabilities(const std::vector<FeatureVector>& scaled) const {
    if (!booster_) {
        throw InferenceFailure("[LightGBM] Model not trained");
    }
    if (scaled.empty()) {
        return {};
    }

    std::vector<double> flat;
    flat.reserve(scaled.size() * kFeatureCount);
    for (const auto& row : scaled) {
        flat.insert(flat.end(), row.begin(), row.end());
    }

    std::vector<double> out(scaled.size(), 0.0);
    int64_t out_len = 0;
    int result = LGBM_BoosterPredictForMat(
        booster_,
        flat.data(),
        C_API_DTYPE_FLOAT64,
        static_cast<int32_t>(scaled.size()),
        static_cast<int32_t>(kFeatureCount),
        1, // row major
        C_API_PREDICT_NORMAL,
        0,
        -1,
        "",
        &out_len,
        out.data()
    );
    if (result != 0 || out_len != static_cast<int64_t>(scaled.size())) {
        throw InferenceFailure(std::string("[LightGBM] Batch prediction failed: ") + LGBM_GetLastError());
    }
    return out;
}

std::vector<double> CollapseClassifier::feature_importance() const {
    std::vector<double> importance(kFeatureCount, 0.0);
    if (!booster_) {
        return importance;
    }

    int result = LGBM_BoosterFeatureImportance(booster_, 0, C_API_FEATURE_IMPORTANCE_GAIN,
                                               importance.data());
    if (result != 0) {
        throw InferenceFailure(std::string("[LightGBM] Feature importance failed: ") + LGBM_GetLastError());
    }

    double total = std::accumulate(importance.begin(), importance.end(), 0.0);
    if (total > 0.0) {
        for (auto& v : importance) {
            v /= total;
        }
    }
    return importance;
}

std::string CollapseClassifier::to_model_string() const {
    if (!booster_) {
        throw ModelStoreError("[LightGBM] Cannot serialise an untrained model");
    }

    int64_t out_len = 0;
    int result = LGBM_BoosterSaveModelToString(booster_, 0, -1, C_API_FEATURE_IMPORTANCE_GAIN,
                                               0, &out_len, nullptr);
    if (result != 0) {
        throw ModelStoreError(std::string("[LightGBM] Failed to size model text: ") + LGBM_GetLastError());
    }

    std::string buffer(static_cast<size_t>(out_len), '\0');
    result = LGBM_BoosterSaveModelToString(booster_, 0, -1, C_API_FEATURE_IMPORTANCE_GAIN,
                                           out_len, &out_len, &buffer[0]);
    if (result != 0) {
        throw ModelStoreError(std::string("[LightGBM] Failed to save model text: ") + LGBM_GetLastError());
    }

    // out_len counts the terminating null
    if (!buffer.empty() && buffer.back() == '\0') {
        buffer.pop_back();
    }
    return buffer;
}

CollapseClassifier CollapseClassifier::from_model_string(const std::string& model_text) {
    CollapseClassifier classifier;
    int num_iterations = 0;
    int result = LGBM_BoosterLoadModelFromString(model_text.c_str(), &num_iterations,
                                                 &classifier.booster_);
    if (result != 0 || !classifier.booster_) {
        throw ModelStoreError(std::string("[LightGBM] Failed to load model: ") + LGBM_GetLastError());
    }

    int num_features = 0;
    if (LGBM_BoosterGetNumFeature(classifier.booster_, &num_features) != 0) {
        throw ModelStoreError(std::string("[LightGBM] Failed to read feature count: ") + LGBM_GetLastError());
    }
    if (static_cast<size_t>(num_features) != kFeatureCount) {
        throw ModelStoreError("[LightGBM] Stored model expects " + std::to_string(num_features) +
                              " features, expected " + std::to_string(kFeatureCount));
    }

    classifier.num_iterations_ = num_iterations;
    return classifier;
}

std::string CollapseClassifier::generate_parameters(
    const std::unordered_map<std::string, std::string>& params) {
    std::string param_str;
    for (const auto& [key, value] : params) {
        param_str += key + "=" + value + " ";
    }
    return param_str;
}

} // namespace ai
} // namespace ecorisk
