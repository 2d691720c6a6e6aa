#include "service_config.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace ecorisk {

namespace {

template <typename T>
void read_option(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value for '") + key + "': " + e.what());
    }
}

} // namespace

ServiceConfig ServiceConfig::from_json(const nlohmann::json& j) {
    ServiceConfig config;
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    read_option(j, "service_name", config.service_name);
    read_option(j, "model_directory", config.model_directory);
    read_option(j, "persist_models", config.persist_models);
    read_option(j, "min_training_points", config.min_training_points);
    read_option(j, "verbose", config.verbose);
    read_option(j, "forecast_seed", config.forecast.seed);
    read_option(j, "max_forecast_steps", config.forecast.max_steps);

    auto training = j.find("training");
    if (training != j.end() && training->is_object()) {
        read_option(*training, "num_trees", config.training.forest.num_trees);
        read_option(*training, "max_depth", config.training.forest.max_depth);
        read_option(*training, "min_samples_split", config.training.forest.min_samples_split);
        read_option(*training, "seed", config.training.forest.seed);
        read_option(*training, "num_threads", config.training.forest.num_threads);
        read_option(*training, "test_fraction", config.training.test_fraction);
        read_option(*training, "split_seed", config.training.split_seed);
    }

    config.training.forest.verbose = config.verbose;
    return config;
}

ServiceConfig ServiceConfig::load(const std::string& path) {
    ServiceConfig config;
    if (!path.empty()) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("Cannot open config file: " + path);
        }
        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Config file " + path + " is not valid JSON: " + e.what());
        }
        config = from_json(j);
        std::cout << "[Config] Loaded configuration from: " << path << std::endl;
    }

    if (const char* dir = std::getenv("ECORISK_MODEL_DIR")) {
        if (*dir) {
            config.model_directory = dir;
        }
    }
    return config;
}

nlohmann::json ServiceConfig::to_json() const {
    nlohmann::json j;
    j["service_name"] = service_name;
    j["model_directory"] = model_directory;
    j["persist_models"] = persist_models;
    j["min_training_points"] = min_training_points;
    j["verbose"] = verbose;
    j["forecast_seed"] = forecast.seed;
    j["max_forecast_steps"] = forecast.max_steps;
    j["training"] = {
        {"num_trees", training.forest.num_trees},
        {"max_depth", training.forest.max_depth},
        {"min_samples_split", training.forest.min_samples_split},
        {"seed", training.forest.seed},
        {"num_threads", training.forest.num_threads},
        {"test_fraction", training.test_fraction},
        {"split_seed", training.split_seed}
    };
    return j;
}

} // namespace ecorisk
