#pragma once
#ifndef ECORISK_PREDICTION_SERVICE_H
#define ECORISK_PREDICTION_SERVICE_H

#include "ai/predictor_context.h"
#include "service_config.h"
#include <string>
#include <nlohmann/json.hpp>

namespace ecorisk {

struct ServiceResponse {
    int status = 200;
    nlohmann::json body;
};

// Request routing for the prediction endpoints. Transport-agnostic: callers
// hand in method, path and raw body and write back status + JSON.
//
//   GET  /health
//   POST /predict/collapse     {features: {current: {...}, history: [...]}, steps}
//   POST /predict/populations  {timeSeries: [...], steps}
//   POST /train                {ecosystem_data: [...]}
class PredictionService {
public:
    PredictionService(ai::PredictorContext& context, ServiceConfig config);

    // Never throws. Malformed JSON and escaped exceptions become 500.
    ServiceResponse handle(const std::string& method, const std::string& path, const std::string& body);

    ServiceResponse health() const;
    ServiceResponse predict_collapse(const nlohmann::json& request);
    ServiceResponse predict_populations(const nlohmann::json& request);
    ServiceResponse train(const nlohmann::json& request);

private:
    ai::PredictorContext& context_;
    ServiceConfig config_;

    static std::string iso_timestamp();
    static ServiceResponse error_response(int status, const std::string& message);
};

} // namespace ecorisk

#endif // ECORISK_PREDICTION_SERVICE_H
