// config.h - Palm signature configuration
// Copyright (c) 2025 Biometric Security Systems

#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <nlohmann/json.hpp>

#include "logger.h"

struct StorageSettings {
    std::string data_directory = "palm_data";
};

struct DetectionSettings {
    std::string provider = "yolo_pose_tflite";
    std::string model_path;
    int timeout_ms = 5000;          // 0 waits indefinitely
    int num_threads = 4;
    int input_size = 640;
    double min_hand_score = 0.25;
    bool normalized_output = true;
    bool keep_landmarks = false;
};

struct MatchingSettings {
    double default_threshold = 0.13;
};

struct LoggingSettings {
    std::string level = "info";
    std::string file;               // empty: console only
    bool json = false;
    bool color = false;
    int max_file_size_mb = 10;
    int max_files = 5;
};

struct PalmSignatureConfig {
    StorageSettings storage;
    DetectionSettings detection;
    MatchingSettings matching;
    LoggingSettings logging;
};

// Overlays values from a JSON file onto config. Unknown keys are warned about;
// a type or range error fails the whole load and leaves config untouched.
bool loadConfiguration(const std::string& config_path, PalmSignatureConfig& config);

// Same rules, from an already parsed document
bool applyConfiguration(const nlohmann::json& document, PalmSignatureConfig& config);

nlohmann::json configToJson(const PalmSignatureConfig& config);

// Maps the logging section onto Logger options. Fails on an unknown level.
bool toLoggerOptions(const LoggingSettings& settings, LoggerOptions& options);

#endif // CONFIG_H
