#include <iostream>
#include <memory>
#include <string>
#include "prediction_service.h"
#include "service_config.h"

// Request loop: one request per line on stdin
//   GET /health
//   POST /predict/collapse {"features": {"current": {...}}}
// Each response is written as "<status> <json>".
int main(int argc, char** argv) {
    try {
        ecorisk::ServiceConfig config = ecorisk::ServiceConfig::load(argc > 1 ? argv[1] : "");

        std::shared_ptr<ecorisk::ai::IModelStore> store;
        if (config.persist_models) {
            store = std::make_shared<ecorisk::ai::FileModelStore>(config.model_directory);
        }

        ecorisk::ai::PredictorContext context(config.training, config.forecast, store);
        if (!context.load_resident()) {
            std::cout << "Using heuristic collapse estimator until a model is trained\n";
        }

        ecorisk::PredictionService service(context, config);
        std::cout << config.service_name << " ready, reading requests from stdin\n";

        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) continue;
            if (line == "quit" || line == "exit") break;

            size_t method_end = line.find(' ');
            std::string method = line.substr(0, method_end);
            std::string rest = method_end == std::string::npos ? "" : line.substr(method_end + 1);
            size_t path_end = rest.find(' ');
            std::string path = rest.substr(0, path_end);
            std::string body = path_end == std::string::npos ? "" : rest.substr(path_end + 1);

            ecorisk::ServiceResponse response = service.handle(method, path, body);
            std::cout << response.status << " " << response.body.dump() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
