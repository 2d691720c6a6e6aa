#include "ai/errors.h"
#include "ai/forecast_engine.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <cmath>

using namespace ecorisk;
using namespace ecorisk::ai;
using ecorisk::test::flat_history;
using ecorisk::test::snap;

namespace {

ForecastConfig seeded(uint32_t seed = 7) {
    ForecastConfig config;
    config.seed = seed;
    return config;
}

ForecastConfig noiseless() {
    ForecastConfig config = seeded();
    config.noise_factor = 0.0;
    return config;
}

} // namespace

TEST(ForecastEngineTest, FlatHistoryIsStable) {
    PopulationForecaster forecaster(seeded());
    ForecastResult r = forecaster.forecast(flat_history(5, 50, 10, 5), 7);

    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.trends.plants, "stable");
    EXPECT_EQ(r.trends.herbivores, "stable");
    EXPECT_EQ(r.trends.carnivores, "stable");
    EXPECT_NEAR(r.confidence, 0.8 * std::pow(0.9, 7), 1e-12);
    EXPECT_EQ(r.horizon, 7);
    ASSERT_EQ(r.predictions.size(), 7u);

    LinearFit fit = PopulationForecaster::fit_line({50, 50, 50, 50, 50});
    EXPECT_NEAR(fit.slope, 0.0, 1e-9);
    EXPECT_NEAR(fit.intercept, 50.0, 1e-9);
}

TEST(ForecastEngineTest, StepsContinueFromLastObservation) {
    PopulationForecaster forecaster(seeded());
    std::vector<Snapshot> history;
    for (int i = 0; i < 6; ++i) {
        history.push_back(snap(100 + i, 50, 10, 5));
    }

    ForecastResult r = forecaster.forecast(history, 3);
    ASSERT_TRUE(r.success);
    ASSERT_EQ(r.predictions.size(), 3u);
    EXPECT_EQ(r.predictions[0].step, 106);
    EXPECT_EQ(r.predictions[1].step, 107);
    EXPECT_EQ(r.predictions[2].step, 108);
}

TEST(ForecastEngineTest, ExtrapolatesLinearTrendWithoutNoise) {
    PopulationForecaster forecaster(noiseless());
    std::vector<Snapshot> history;
    for (int i = 0; i < 12; ++i) {
        history.push_back(snap(i, 10.0 + 3.0 * i, 100.0 - 4.0 * i, 20));
    }

    ForecastResult r = forecaster.forecast(history, 2);
    ASSERT_TRUE(r.success);

    // Last 10 points are indices 2..11; next is index 12. Values are
    // truncated, so a least-squares result a hair under the line drops by one.
    EXPECT_NEAR(r.predictions[0].plants, 46, 1);
    EXPECT_NEAR(r.predictions[0].herbivores, 52, 1);
    EXPECT_NEAR(r.predictions[0].carnivores, 20, 1);
    EXPECT_NEAR(r.predictions[1].plants, 49, 1);
    EXPECT_NEAR(r.predictions[1].herbivores, 48, 1);

    EXPECT_EQ(r.trends.plants, "increasing");
    EXPECT_EQ(r.trends.herbivores, "decreasing");
    EXPECT_EQ(r.trends.carnivores, "stable");
}

TEST(ForecastEngineTest, ForecastsAreClampedNonNegative) {
    PopulationForecaster forecaster(noiseless());
    std::vector<Snapshot> history;
    for (int i = 0; i < 5; ++i) {
        history.push_back(snap(i, 40.0 - 10.0 * i, 5, 5));
    }

    ForecastResult r = forecaster.forecast(history, 3);
    ASSERT_TRUE(r.success);
    for (const auto& p : r.predictions) {
        EXPECT_EQ(p.plants, 0);
    }
}

TEST(ForecastEngineTest, NoisyForecastStaysNonNegative) {
    PopulationForecaster forecaster(seeded(11));
    ForecastResult r = forecaster.forecast(flat_history(10, 50, 10, 5), 30);
    ASSERT_TRUE(r.success);
    for (const auto& p : r.predictions) {
        EXPECT_GE(p.plants, 0);
        EXPECT_GE(p.herbivores, 0);
        EXPECT_GE(p.carnivores, 0);
    }
}

TEST(ForecastEngineTest, SameSeedGivesSameForecast) {
    PopulationForecaster a(seeded(42));
    PopulationForecaster b(seeded(42));
    auto history = flat_history(8, 50, 10, 5);

    ForecastResult ra = a.forecast(history, 5);
    ForecastResult rb = b.forecast(history, 5);
    ASSERT_EQ(ra.predictions.size(), rb.predictions.size());
    for (size_t i = 0; i < ra.predictions.size(); ++i) {
        EXPECT_EQ(ra.predictions[i].plants, rb.predictions[i].plants);
        EXPECT_EQ(ra.predictions[i].herbivores, rb.predictions[i].herbivores);
        EXPECT_EQ(ra.predictions[i].carnivores, rb.predictions[i].carnivores);
    }
}

TEST(ForecastEngineTest, ConfidenceDecreasesWithHorizon) {
    PopulationForecaster forecaster(seeded());
    double previous = 1.0;
    for (int steps = 1; steps <= 10; ++steps) {
        double c = forecaster.confidence_for(steps);
        EXPECT_LT(c, previous);
        previous = c;
    }
}

TEST(ForecastEngineTest, ShortHistoryReportsFailure) {
    PopulationForecaster forecaster(seeded());
    auto history = flat_history(4, 50, 10, 5);

    EXPECT_THROW(forecaster.project(history, 7), InsufficientDataError);

    ForecastResult r = forecaster.forecast(history, 7);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Need at least 5 data points for forecasting");
    EXPECT_FALSE(r.to_json()["success"].get<bool>());
}

TEST(ForecastEngineTest, ZeroHorizonIsEmptyForecast) {
    PopulationForecaster forecaster(seeded());
    ForecastResult r = forecaster.forecast(flat_history(5, 50, 10, 5), 0);

    ASSERT_TRUE(r.success) << r.error;
    EXPECT_TRUE(r.predictions.empty());
    EXPECT_DOUBLE_EQ(r.confidence, 0.8);
    EXPECT_EQ(r.horizon, 0);
    EXPECT_EQ(r.trends.plants, "stable");
}

TEST(ForecastEngineTest, RejectsNegativeHorizon) {
    PopulationForecaster forecaster(seeded());
    auto history = flat_history(5, 50, 10, 5);
    EXPECT_THROW(forecaster.project(history, -1), InvalidInputError);
    EXPECT_FALSE(forecaster.forecast(history, -3).success);
}

TEST(ForecastEngineTest, AcceptsLongHorizons) {
    PopulationForecaster forecaster(noiseless());
    ForecastResult r = forecaster.forecast(flat_history(5, 50, 10, 5), 400);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.predictions.size(), 400u);
}

TEST(ForecastEngineTest, RejectsHorizonAboveConfiguredLimit) {
    ForecastConfig config = seeded();
    config.max_steps = 30;
    PopulationForecaster forecaster(config);
    EXPECT_THROW(forecaster.project(flat_history(5, 50, 10, 5), 31), InvalidInputError);
}

TEST(ForecastEngineTest, SteepDeclineClampsToZero) {
    PopulationForecaster forecaster(noiseless());
    std::vector<Snapshot> history;
    const double plants[] = {4e25, 3e25, 2e25, 1e25, 0};
    for (int i = 0; i < 5; ++i) {
        history.push_back(snap(i, plants[i], 10, 5));
    }

    ForecastResult r = forecaster.forecast(history, 3);
    ASSERT_TRUE(r.success) << r.error;
    for (const auto& p : r.predictions) {
        EXPECT_EQ(p.plants, 0);
    }
    EXPECT_EQ(r.trends.plants, "decreasing");
}

TEST(ForecastEngineTest, SteepRiseSaturates) {
    PopulationForecaster forecaster(noiseless());
    std::vector<Snapshot> history;
    for (int i = 0; i < 5; ++i) {
        history.push_back(snap(i, 1e25 * i, 10, 5));
    }

    ForecastResult r = forecaster.forecast(history, 2);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.predictions[0].plants, static_cast<int64_t>(9.0e15));
}

TEST(ForecastEngineTest, JsonShape) {
    PopulationForecaster forecaster(seeded());
    nlohmann::json j = forecaster.forecast(flat_history(5, 50, 10, 5), 2).to_json();

    EXPECT_TRUE(j["success"].get<bool>());
    ASSERT_EQ(j["predictions"].size(), 2u);
    EXPECT_EQ(j["predictions"][0]["step"], 5);
    EXPECT_TRUE(j["predictions"][0]["plants"].is_number_integer());
    EXPECT_EQ(j["trends"]["plants"], "stable");
    EXPECT_EQ(j["forecast_horizon"], 2);
}
