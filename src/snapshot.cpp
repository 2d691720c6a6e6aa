#include "snapshot.h"
#include "ai/errors.h"
#include <string>

namespace ecorisk {

namespace {

double read_count(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw ai::InvalidInputError(std::string("Snapshot missing field: ") + key);
    }
    if (!it->is_number()) {
        throw ai::InvalidInputError(std::string("Snapshot field is not numeric: ") + key);
    }
    return it->get<double>();
}

} // namespace

nlohmann::json Snapshot::to_json() const {
    nlohmann::json j;
    j["step"] = step;
    j["plants"] = plants;
    j["herbivores"] = herbivores;
    j["carnivores"] = carnivores;
    return j;
}

Snapshot Snapshot::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ai::InvalidInputError("Snapshot must be a JSON object");
    }

    Snapshot s;
    auto step_it = j.find("step");
    if (step_it != j.end() && !step_it->is_null()) {
        if (!step_it->is_number()) {
            throw ai::InvalidInputError("Snapshot field is not numeric: step");
        }
        s.step = step_it->is_number_integer() ? step_it->get<int64_t>()
                                              : static_cast<int64_t>(step_it->get<double>());
    }
    s.plants = read_count(j, "plants");
    s.herbivores = read_count(j, "herbivores");
    s.carnivores = read_count(j, "carnivores");
    return s;
}

std::vector<Snapshot> snapshots_from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw ai::InvalidInputError("Expected an array of snapshots");
    }

    std::vector<Snapshot> out;
    out.reserve(j.size());
    for (const auto& item : j) {
        out.push_back(Snapshot::from_json(item));
    }
    return out;
}

} // namespace ecorisk
