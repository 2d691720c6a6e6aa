#include "service_config.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>

using namespace ecorisk;
using ecorisk::test::TempDir;

TEST(ServiceConfigTest, Defaults) {
    ServiceConfig config;
    EXPECT_EQ(config.service_name, "ML Prediction Service");
    EXPECT_EQ(config.model_directory, "trained_models");
    EXPECT_TRUE(config.persist_models);
    EXPECT_EQ(config.min_training_points, 50u);
    EXPECT_EQ(config.training.forest.num_trees, 100);
    EXPECT_EQ(config.training.forest.max_depth, 10);
    EXPECT_EQ(config.training.forest.min_samples_split, 5);
    EXPECT_DOUBLE_EQ(config.training.test_fraction, 0.2);
    EXPECT_EQ(config.forecast.max_steps, 100000);
}

TEST(ServiceConfigTest, JsonOverridesSelectedKeys) {
    nlohmann::json j = {
        {"service_name", "Reef Watch"},
        {"persist_models", false},
        {"min_training_points", 80},
        {"max_forecast_steps", 30},
        {"training", {{"num_trees", 25}, {"split_seed", 7}}},
        {"unrelated", "ignored"}
    };
    ServiceConfig config = ServiceConfig::from_json(j);

    EXPECT_EQ(config.service_name, "Reef Watch");
    EXPECT_FALSE(config.persist_models);
    EXPECT_EQ(config.min_training_points, 80u);
    EXPECT_EQ(config.forecast.max_steps, 30);
    EXPECT_EQ(config.training.forest.num_trees, 25);
    EXPECT_EQ(config.training.split_seed, 7);
    EXPECT_EQ(config.training.forest.max_depth, 10);
    EXPECT_EQ(config.model_directory, "trained_models");
}

TEST(ServiceConfigTest, WrongValueTypeIsRejected) {
    nlohmann::json bad = {{"min_training_points", "fifty"}};
    EXPECT_THROW(ServiceConfig::from_json(bad), std::runtime_error);
    EXPECT_THROW(ServiceConfig::from_json(nlohmann::json::array()), std::runtime_error);
}

TEST(ServiceConfigTest, LoadsFileAndHonoursModelDirOverride) {
    TempDir dir;
    std::string path = (dir.path() / "ecorisk.json").string();
    {
        std::ofstream out(path);
        out << R"({"model_directory": "from_file", "verbose": true})";
    }

    unsetenv("ECORISK_MODEL_DIR");
    ServiceConfig plain = ServiceConfig::load(path);
    EXPECT_EQ(plain.model_directory, "from_file");
    EXPECT_TRUE(plain.training.forest.verbose);

    setenv("ECORISK_MODEL_DIR", "/var/lib/ecorisk", 1);
    ServiceConfig overridden = ServiceConfig::load(path);
    unsetenv("ECORISK_MODEL_DIR");
    EXPECT_EQ(overridden.model_directory, "/var/lib/ecorisk");
}

TEST(ServiceConfigTest, MissingFileIsAnError) {
    TempDir dir;
    EXPECT_THROW(ServiceConfig::load((dir.path() / "absent.json").string()), std::runtime_error);
}

TEST(ServiceConfigTest, ToJsonRoundTrips) {
    ServiceConfig config;
    config.service_name = "Wetlands";
    config.training.forest.num_trees = 40;

    ServiceConfig restored = ServiceConfig::from_json(config.to_json());
    EXPECT_EQ(restored.service_name, "Wetlands");
    EXPECT_EQ(restored.training.forest.num_trees, 40);
}
