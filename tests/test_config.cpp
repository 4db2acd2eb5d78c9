// test_config.cpp - Configuration loading and serialization
// Copyright (c) 2025 Biometric Security Systems

#include <gtest/gtest.h>

#include "utils/config.h"
#include "test_helpers.h"

namespace palm_testing {

class ConfigTest : public ::testing::Test {
protected:
    std::string writeConfig(const std::string& content) {
        std::string path = dir_.file("config.json");
        writeFile(path, content);
        return path;
    }

    TempDirectory dir_;
    PalmSignatureConfig config_;
};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    EXPECT_EQ(config_.storage.data_directory, "palm_data");
    EXPECT_EQ(config_.detection.provider, "yolo_pose_tflite");
    EXPECT_EQ(config_.detection.timeout_ms, 5000);
    EXPECT_EQ(config_.detection.input_size, 640);
    EXPECT_DOUBLE_EQ(config_.detection.min_hand_score, 0.25);
    EXPECT_FALSE(config_.detection.keep_landmarks);
    EXPECT_DOUBLE_EQ(config_.matching.default_threshold, 0.13);
    EXPECT_EQ(config_.logging.level, "info");
    EXPECT_TRUE(config_.logging.file.empty());
}

TEST_F(ConfigTest, OverridesOnlyGivenKeys) {
    std::string path = writeConfig(R"({
        "storage": {"data_directory": "/var/lib/palms"},
        "detection": {"timeout_ms": 0, "keep_landmarks": true},
        "matching": {"default_threshold": 0.2}
    })");

    ASSERT_TRUE(loadConfiguration(path, config_));
    EXPECT_EQ(config_.storage.data_directory, "/var/lib/palms");
    EXPECT_EQ(config_.detection.timeout_ms, 0);
    EXPECT_TRUE(config_.detection.keep_landmarks);
    EXPECT_EQ(config_.detection.num_threads, 4);
    EXPECT_DOUBLE_EQ(config_.matching.default_threshold, 0.2);
    EXPECT_EQ(config_.logging.level, "info");
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
    std::string path = writeConfig(R"({"detection": {"gpu": true}, "extras": 1})");
    EXPECT_TRUE(loadConfiguration(path, config_));
}

TEST_F(ConfigTest, MissingFileFails) {
    EXPECT_FALSE(loadConfiguration(dir_.file("absent.json"), config_));
}

TEST_F(ConfigTest, InvalidJsonFails) {
    std::string path = writeConfig("{\"storage\": ");
    EXPECT_FALSE(loadConfiguration(path, config_));
}

TEST_F(ConfigTest, TypeErrorFailsWithoutPartialUpdate) {
    std::string path = writeConfig(R"({
        "storage": {"data_directory": "elsewhere"},
        "detection": {"timeout_ms": "fast"}
    })");

    EXPECT_FALSE(loadConfiguration(path, config_));
    EXPECT_EQ(config_.storage.data_directory, "palm_data");
    EXPECT_EQ(config_.detection.timeout_ms, 5000);
}

TEST_F(ConfigTest, OutOfRangeValuesFail) {
    EXPECT_FALSE(loadConfiguration(writeConfig(R"({"detection": {"min_hand_score": 1.5}})"), config_));
    EXPECT_FALSE(loadConfiguration(writeConfig(R"({"detection": {"timeout_ms": -1}})"), config_));
    EXPECT_FALSE(loadConfiguration(writeConfig(R"({"matching": {"default_threshold": -0.1}})"), config_));
    EXPECT_FALSE(loadConfiguration(writeConfig(R"({"logging": {"level": "chatty"}})"), config_));
    EXPECT_FALSE(loadConfiguration(writeConfig(R"({"storage": []})"), config_));
    EXPECT_FALSE(loadConfiguration(writeConfig("[]"), config_));
}

TEST_F(ConfigTest, SerializedConfigLoadsBackUnchanged) {
    config_.storage.data_directory = "custom";
    config_.detection.model_path = "models/hand.tflite";
    config_.logging.level = "debug";

    PalmSignatureConfig reloaded;
    ASSERT_TRUE(applyConfiguration(configToJson(config_), reloaded));
    EXPECT_EQ(configToJson(reloaded), configToJson(config_));
}

TEST_F(ConfigTest, LoggingSectionMapsToLoggerOptions) {
    config_.logging.level = "WARNING";
    config_.logging.file = "/tmp/palm.log";
    config_.logging.max_file_size_mb = 2;

    LoggerOptions options;
    ASSERT_TRUE(toLoggerOptions(config_.logging, options));
    EXPECT_EQ(options.level, LogLevel::WARNING);
    EXPECT_EQ(options.file_path, "/tmp/palm.log");
    EXPECT_EQ(options.max_file_size, 2u * 1024 * 1024);

    config_.logging.level = "verbose";
    EXPECT_FALSE(toLoggerOptions(config_.logging, options));
}

} // namespace palm_testing
