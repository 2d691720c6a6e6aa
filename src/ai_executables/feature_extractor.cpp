#include "ai/feature_extractor.h"
#include "ai/errors.h"
#include <algorithm>
#include <cmath>

namespace ecorisk {
namespace ai {

namespace {

struct SeriesStats {
    double min_value;
    double max_value;
    double std_value;
};

// Population (ddof = 0) statistics over one species column
template <typename Getter>
SeriesStats series_stats(const Snapshot* first, const Snapshot* last, Getter get) {
    const double n = static_cast<double>(last - first + 1);

    double sum = 0.0;
    double lo = get(*first);
    double hi = lo;
    for (const Snapshot* s = first; s <= last; ++s) {
        double v = get(*s);
        sum += v;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }

    const double mean = sum / n;
    double sq = 0.0;
    for (const Snapshot* s = first; s <= last; ++s) {
        double d = get(*s) - mean;
        sq += d * d;
    }

    return {lo, hi, std::sqrt(sq / n)};
}

} // namespace

FeatureVector FeatureExtractor::extract(const std::vector<Snapshot>& window) {
    if (window.size() < kLookbackWindow) {
        throw InsufficientDataError("Need at least " + std::to_string(kLookbackWindow) +
                                    " snapshots to build a feature window, got " +
                                    std::to_string(window.size()));
    }
    if (window.size() > kLookbackWindow) {
        throw InvalidInputError("Feature window must hold exactly " +
                                std::to_string(kLookbackWindow) + " snapshots, got " +
                                std::to_string(window.size()));
    }
    return compute(&window.front(), &window.back());
}

FeatureVector FeatureExtractor::extract_latest(const std::vector<Snapshot>& recent) {
    if (recent.size() < kLookbackWindow) {
        throw InsufficientDataError("Need at least " + std::to_string(kLookbackWindow) +
                                    " recent data points, got " + std::to_string(recent.size()));
    }
    return compute(&recent[recent.size() - kLookbackWindow], &recent.back());
}

FeatureVector FeatureExtractor::extract_at(const std::vector<Snapshot>& history, size_t end) {
    if (end < kLookbackWindow || end > history.size()) {
        throw InsufficientDataError("No complete lookback window ends at index " +
                                    std::to_string(end));
    }
    return compute(&history[end - kLookbackWindow], &history[end - 1]);
}

FeatureVector FeatureExtractor::compute(const Snapshot* first, const Snapshot* last) {
    const double window = static_cast<double>(kLookbackWindow);
    const Snapshot& cur = *last;

    auto plants = [](const Snapshot& s) { return s.plants; };
    auto herbivores = [](const Snapshot& s) { return s.herbivores; };
    auto carnivores = [](const Snapshot& s) { return s.carnivores; };

    SeriesStats p = series_stats(first, last, plants);
    SeriesStats h = series_stats(first, last, herbivores);
    SeriesStats c = series_stats(first, last, carnivores);

    FeatureVector f;
    f[0] = cur.plants;
    f[1] = cur.herbivores;
    f[2] = cur.carnivores;

    f[3] = (cur.plants - first->plants) / window;
    f[4] = (cur.herbivores - first->herbivores) / window;
    f[5] = (cur.carnivores - first->carnivores) / window;

    // carnivores/herbivores is intentional, the trained models depend on it
    f[6] = cur.plants / std::max(cur.herbivores, 1.0);
    f[7] = cur.herbivores / std::max(cur.carnivores, 1.0);
    f[8] = cur.carnivores / std::max(cur.herbivores, 1.0);

    f[9] = cur.plants + cur.herbivores + cur.carnivores;

    f[10] = p.std_value;
    f[11] = h.std_value;
    f[12] = c.std_value;

    f[13] = p.min_value;
    f[14] = p.max_value;
    f[15] = h.min_value;
    f[16] = h.max_value;
    f[17] = c.min_value;
    f[18] = c.max_value;
    return f;
}

const std::array<std::string, kFeatureCount>& FeatureExtractor::feature_names() {
    static const std::array<std::string, kFeatureCount> names = {
        "plants", "herbivores", "carnivores",
        "plant_trend", "herbivore_trend", "carnivore_trend",
        "plant_herb_ratio", "herb_carn_ratio", "carn_herb_ratio",
        "total_biomass",
        "plant_volatility", "herbivore_volatility", "carnivore_volatility",
        "min_plants", "max_plants",
        "min_herbivores", "max_herbivores",
        "min_carnivores", "max_carnivores"
    };
    return names;
}

} // namespace ai
} // namespace ecorisk
