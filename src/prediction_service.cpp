#include "prediction_service.h"
#include "ai/errors.h"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace ecorisk {

namespace {

// Reads an integral "steps" field without the unchecked double -> int cast
int read_steps(const nlohmann::json& request, int fallback) {
    auto it = request.find("steps");
    if (it == request.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_number_integer()) {
        if (it->is_number_unsigned()) {
            auto value = it->get<uint64_t>();
            if (value > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
                throw ai::InvalidInputError("steps is out of range");
            }
            return static_cast<int>(value);
        }
        auto value = it->get<int64_t>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            throw ai::InvalidInputError("steps is out of range");
        }
        return static_cast<int>(value);
    }
    if (it->is_number_float()) {
        double value = it->get<double>();
        if (!std::isfinite(value) || std::trunc(value) != value) {
            throw ai::InvalidInputError("steps must be a whole number");
        }
        if (value < static_cast<double>(std::numeric_limits<int>::min()) ||
            value > static_cast<double>(std::numeric_limits<int>::max())) {
            throw ai::InvalidInputError("steps is out of range");
        }
        return static_cast<int>(value);
    }
    throw ai::InvalidInputError("steps must be a number");
}

} // namespace

PredictionService::PredictionService(ai::PredictorContext& context, ServiceConfig config)
    : context_(context), config_(std::move(config)) {}

ServiceResponse PredictionService::handle(const std::string& method, const std::string& path,
                                          const std::string& body) {
    std::string route = path.substr(0, path.find('?'));

    try {
        if (route == "/health") {
            if (method != "GET") return error_response(405, "Method not allowed");
            return health();
        }

        if (route != "/predict/collapse" && route != "/predict/populations" && route != "/train") {
            return error_response(404, "Not found");
        }
        if (method != "POST") {
            return error_response(405, "Method not allowed");
        }

        nlohmann::json request = nlohmann::json::parse(body);
        if (!request.is_object()) {
            throw ai::InvalidInputError("Request body must be a JSON object");
        }

        if (route == "/predict/collapse") return predict_collapse(request);
        if (route == "/predict/populations") return predict_populations(request);
        return train(request);
    } catch (const std::exception& e) {
        std::cerr << "[Service] Error in " << route << ": " << e.what() << std::endl;
        return error_response(500, e.what());
    }
}

ServiceResponse PredictionService::health() const {
    ServiceResponse response;
    response.body["status"] = "healthy";
    response.body["service"] = config_.service_name;
    response.body["models_loaded"] = context_.models_loaded();
    response.body["timestamp"] = iso_timestamp();
    return response;
}

ServiceResponse PredictionService::predict_collapse(const nlohmann::json& request) {
    int steps = read_steps(request, 5);

    auto features = request.find("features");
    if (features == request.end() || !features->is_object() || !features->contains("current")) {
        ServiceResponse response;
        response.body = {{"success", false}, {"error", "Invalid features format"}};
        return response;
    }

    std::vector<Snapshot> recent;
    auto history = features->find("history");
    if (history != features->end() && !history->is_null()) {
        recent = snapshots_from_json(*history);
    }
    recent.push_back(Snapshot::from_json(features->at("current")));

    ServiceResponse response;
    response.body = context_.predict_risk(recent, steps).to_json();
    return response;
}

ServiceResponse PredictionService::predict_populations(const nlohmann::json& request) {
    ServiceResponse response;
    int steps = 7;
    std::vector<Snapshot> series;
    try {
        steps = read_steps(request, 7);
        series = snapshots_from_json(request.value("timeSeries", nlohmann::json::array()));
    } catch (const ai::InvalidInputError& e) {
        response.body = ai::ForecastResult::failure(e.what()).to_json();
        return response;
    }

    response.body = context_.forecast(series, steps).to_json();
    return response;
}

ServiceResponse PredictionService::train(const nlohmann::json& request) {
    ServiceResponse response;
    nlohmann::json data = request.value("ecosystem_data", nlohmann::json::array());

    if (!data.is_array() || data.size() < config_.min_training_points) {
        response.body = {
            {"success", false},
            {"error", "Need at least " + std::to_string(config_.min_training_points) +
                      " data points for training"}
        };
        return response;
    }

    std::vector<Snapshot> history;
    try {
        history = snapshots_from_json(data);
    } catch (const ai::InvalidInputError& e) {
        response.body = ai::TrainingReport::failure(e.what()).to_json();
        return response;
    }

    response.body = context_.train(history).to_json();
    return response;
}

std::string PredictionService::iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

ServiceResponse PredictionService::error_response(int status, const std::string& message) {
    ServiceResponse response;
    response.status = status;
    response.body = {{"success", false}, {"error", message}};
    return response;
}

} // namespace ecorisk
