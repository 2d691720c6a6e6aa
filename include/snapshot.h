#pragma once
#ifndef ECORISK_SNAPSHOT_H
#define ECORISK_SNAPSHOT_H

#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace ecorisk {

// One time-stepped observation of the three populations
struct Snapshot {
    int64_t step = 0;
    double plants = 0.0;
    double herbivores = 0.0;
    double carnivores = 0.0;

    nlohmann::json to_json() const;
    static Snapshot from_json(const nlohmann::json& j);
};

// Parses a JSON array of snapshots. Throws InvalidInputError on bad shape.
std::vector<Snapshot> snapshots_from_json(const nlohmann::json& j);

} // namespace ecorisk

#endif // ECORISK_SNAPSHOT_H
