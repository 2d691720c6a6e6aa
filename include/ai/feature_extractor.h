#pragma once
#ifndef ECORISK_FEATURE_EXTRACTOR_H
#define ECORISK_FEATURE_EXTRACTOR_H

#include "snapshot.h"
#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace ecorisk {
namespace ai {

constexpr size_t kLookbackWindow = 5;
constexpr size_t kFeatureCount = 19;

using FeatureVector = std::array<double, kFeatureCount>;

// Turns a lookback window of snapshots into the fixed feature vector used by
// both the training and the inference path:
//   0-2   current plants, herbivores, carnivores
//   3-5   (last - first) / window per species
//   6-8   plants/herbivores, herbivores/carnivores, carnivores/herbivores
//         (denominators floored at 1)
//   9     total biomass
//   10-12 population standard deviation per species
//   13-18 min/max plants, min/max herbivores, min/max carnivores
class FeatureExtractor {
public:
    // window must hold exactly kLookbackWindow snapshots
    static FeatureVector extract(const std::vector<Snapshot>& window);

    // Uses the last kLookbackWindow snapshots of recent
    static FeatureVector extract_latest(const std::vector<Snapshot>& recent);

    // Uses history[end - kLookbackWindow, end)
    static FeatureVector extract_at(const std::vector<Snapshot>& history, size_t end);

    static const std::array<std::string, kFeatureCount>& feature_names();

private:
    static FeatureVector compute(const Snapshot* first, const Snapshot* last);
};

} // namespace ai
} // namespace ecorisk

#endif // ECORISK_FEATURE_EXTRACTOR_H
