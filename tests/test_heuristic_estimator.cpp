#include "ai/errors.h"
#include "ai/risk_estimator.h"
#include "test_support.h"
#include <gtest/gtest.h>

using namespace ecorisk;
using namespace ecorisk::ai;
using ecorisk::test::snap;

TEST(HeuristicEstimatorTest, ScoresCriticalSnapshot) {
    HeuristicEstimator heuristic;
    RiskResult r = heuristic.estimate({snap(0, 8, 2, 5)}, 5);

    ASSERT_TRUE(r.success);
    EXPECT_NEAR(r.risk, 0.9, 1e-9);
    EXPECT_DOUBLE_EQ(r.confidence, 0.6);
    EXPECT_EQ(r.model_version, "heuristic");

    ASSERT_EQ(r.factors.size(), 3u);
    EXPECT_EQ(r.factors[0].name, "critically_low_plants");
    EXPECT_DOUBLE_EQ(r.factors[0].importance, 0.4);
    EXPECT_EQ(r.factors[1].name, "critically_low_herbivores");
    EXPECT_DOUBLE_EQ(r.factors[1].importance, 0.3);
    EXPECT_EQ(r.factors[2].name, "predator_overload");
    EXPECT_DOUBLE_EQ(r.factors[2].importance, 0.2);
}

TEST(HeuristicEstimatorTest, LowPlantsOnlyWhenNotCritical) {
    HeuristicEstimator heuristic;
    RiskResult r = heuristic.estimate({snap(0, 25, 10, 5)}, 5);
    ASSERT_EQ(r.factors.size(), 1u);
    EXPECT_EQ(r.factors[0].name, "low_plants");
    EXPECT_NEAR(r.risk, 0.2, 1e-12);
}

TEST(HeuristicEstimatorTest, HealthySnapshotHasNoRisk) {
    HeuristicEstimator heuristic;
    RiskResult r = heuristic.estimate({snap(0, 100, 20, 5)}, 5);
    EXPECT_DOUBLE_EQ(r.risk, 0.0);
    EXPECT_TRUE(r.factors.empty());
    EXPECT_EQ(r.risk_level(), "minimal");
}

TEST(HeuristicEstimatorTest, PredatorOverloadIsStrictlyGreater) {
    HeuristicEstimator heuristic;
    EXPECT_TRUE(heuristic.estimate({snap(0, 100, 10, 15)}, 5).factors.empty());
    EXPECT_EQ(heuristic.estimate({snap(0, 100, 10, 16)}, 5).factors.size(), 1u);
}

TEST(HeuristicEstimatorTest, DecliningPlantTrendNeedsThreePoints) {
    HeuristicEstimator heuristic;

    std::vector<Snapshot> two = {snap(0, 100, 10, 5), snap(1, 40, 10, 5)};
    EXPECT_TRUE(heuristic.estimate(two, 5).factors.empty());

    std::vector<Snapshot> three = {snap(0, 100, 10, 5), snap(1, 80, 10, 5), snap(2, 60, 10, 5)};
    RiskResult r = heuristic.estimate(three, 5);
    ASSERT_EQ(r.factors.size(), 1u);
    EXPECT_EQ(r.factors[0].name, "declining_plant_trend");
    EXPECT_NEAR(r.risk, 0.15, 1e-12);
}

TEST(HeuristicEstimatorTest, TrendUsesLastThreeSnapshots) {
    HeuristicEstimator heuristic;
    // Steep fall early on, flat over the final three points
    std::vector<Snapshot> recent = {
        snap(0, 200, 10, 5), snap(1, 60, 10, 5), snap(2, 60, 10, 5), snap(3, 60, 10, 5)
    };
    EXPECT_TRUE(heuristic.estimate(recent, 5).factors.empty());
}

TEST(HeuristicEstimatorTest, RiskIsClampedToOne) {
    HeuristicEstimator heuristic;
    std::vector<Snapshot> recent = {snap(0, 40, 2, 5), snap(1, 20, 2, 5), snap(2, 1, 1, 5)};
    RiskResult r = heuristic.estimate(recent, 5);
    EXPECT_EQ(r.factors.size(), 4u);
    EXPECT_DOUBLE_EQ(r.risk, 1.0);
    EXPECT_EQ(r.risk_level(), "critical");
}

TEST(HeuristicEstimatorTest, EmptyInputIsAnError) {
    HeuristicEstimator heuristic;
    EXPECT_THROW(heuristic.estimate({}, 5), InvalidInputError);
}

TEST(RiskResultTest, RiskLevelBands) {
    RiskResult r;
    r.risk = 0.2;
    EXPECT_EQ(r.risk_level(), "minimal");
    r.risk = 0.21;
    EXPECT_EQ(r.risk_level(), "low");
    r.risk = 0.5;
    EXPECT_EQ(r.risk_level(), "moderate");
    r.risk = 0.7;
    EXPECT_EQ(r.risk_level(), "high");
    r.risk = 0.81;
    EXPECT_EQ(r.risk_level(), "critical");
}

TEST(RiskResultTest, JsonCarriesFactorsInOrder) {
    HeuristicEstimator heuristic;
    nlohmann::json j = heuristic.estimate({snap(0, 8, 2, 5)}, 3).to_json();

    EXPECT_TRUE(j["success"].get<bool>());
    EXPECT_EQ(j["model_version"], "heuristic");
    EXPECT_EQ(j["steps_ahead"], 3);
    ASSERT_EQ(j["factors"].size(), 3u);
    EXPECT_EQ(j["factors"][0]["factor"], "critically_low_plants");
    EXPECT_EQ(j["risk_level"], "critical");
}
