// config_test.cpp — YAML configuration loading and validation

#include <gtest/gtest.h>

#include "posescope/Config.h"
#include "posescope/Errors.h"
#include "test_helpers.hpp"

#include <yaml-cpp/yaml.h>

using namespace posescope;

TEST(ConfigTest, ParsesEverySection) {
    const YAML::Node root = YAML::Load(R"(
relational:
  database: /data/pose.db
  busy_timeout_ms: 500
  pool_size: 2
fallback:
  root: /data/tracks
  metadata: [meta/a.csv, /abs/b.csv]
analysis:
  frame_rate: 25
  workers: 3
  likelihood_threshold: 0.8
  corner_landmarks: [TL, TR, BL]
  extent_landmark: ""
logging:
  level: debug
)");
    const PipelineConfig config = config_from_yaml(root);
    EXPECT_EQ(config.relational.databasePath, "/data/pose.db");
    EXPECT_EQ(config.relational.busyTimeoutMs, 500);
    EXPECT_EQ(config.relational.poolSize, 2u);
    EXPECT_EQ(config.fallback.root, "/data/tracks");
    EXPECT_DOUBLE_EQ(config.analysis.frameRate, 25.0);
    EXPECT_EQ(config.analysis.workers, 3u);
    EXPECT_DOUBLE_EQ(config.analysis.likelihoodThreshold, 0.8);
    EXPECT_EQ(config.analysis.cornerLandmarks, (std::vector<std::string>{"TL", "TR", "BL"}));
    EXPECT_TRUE(config.analysis.extentLandmark.empty());
    EXPECT_EQ(config.logLevel, "debug");

    const auto files = config.resolvedMetadataFiles();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "/data/tracks/meta/a.csv");
    EXPECT_EQ(files[1], "/abs/b.csv");
}

TEST(ConfigTest, MissingSectionsKeepDefaults) {
    const PipelineConfig config = config_from_yaml(YAML::Load("fallback:\n  root: /x\n"));
    EXPECT_TRUE(config.relational.databasePath.empty());
    EXPECT_EQ(config.relational.poolSize, contract::DEFAULT_POOL_SIZE);
    EXPECT_DOUBLE_EQ(config.analysis.frameRate, contract::DEFAULT_FRAME_RATE_HZ);
    EXPECT_DOUBLE_EQ(config.analysis.likelihoodThreshold, contract::DEFAULT_LIKELIHOOD_THRESHOLD);
    EXPECT_EQ(config.analysis.extentLandmark, "Midback");
    EXPECT_EQ(config.logLevel, "info");
}

TEST(ConfigTest, WrongValueTypeIsConfigurationError) {
    EXPECT_THROW(config_from_yaml(YAML::Load("analysis:\n  workers: many\n")), ConfigurationError);
}

TEST(ConfigTest, LoadConfigReadsFileAndRejectsMissingOne) {
    test_helpers::ScratchDir dir;
    const std::string path = dir.file("posescope.yaml");
    test_helpers::write_file(path, "fallback:\n  root: " + dir.path().string() + "\n");
    EXPECT_EQ(load_config(path).fallback.root, dir.path().string());
    EXPECT_THROW(load_config(dir.file("absent.yaml")), ConfigurationError);
}

TEST(ConfigTest, ValidateRejectsBatchFatalSettings) {
    test_helpers::ScratchDir dir;
    PipelineConfig config;
    config.fallback.root = dir.path().string();
    EXPECT_NO_THROW(validate_config(config));

    PipelineConfig noRoot = config;
    noRoot.fallback.root = dir.file("missing");
    EXPECT_THROW(validate_config(noRoot), ConfigurationError);

    PipelineConfig zeroWorkers = config;
    zeroWorkers.analysis.workers = 0;
    EXPECT_THROW(validate_config(zeroWorkers), ConfigurationError);

    PipelineConfig badTheta = config;
    badTheta.analysis.likelihoodThreshold = 1.5;
    EXPECT_THROW(validate_config(badTheta), ConfigurationError);

    PipelineConfig zeroPool = config;
    zeroPool.relational.poolSize = 0;
    EXPECT_THROW(validate_config(zeroPool), ConfigurationError);
}
