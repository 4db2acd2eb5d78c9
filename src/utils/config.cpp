// config.cpp - Palm signature configuration
// Copyright (c) 2025 Biometric Security Systems

#include "config.h"

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace {

void warnUnknownKeys(const nlohmann::json& section, const std::string& prefix,
                     const std::set<std::string>& known) {
    for (auto it = section.begin(); it != section.end(); ++it) {
        if (known.count(it.key()) == 0) {
            Logger::warning("Ignoring unknown configuration key: " + prefix + it.key(), "config");
        }
    }
}

bool readString(const nlohmann::json& section, const std::string& path, const char* key,
                std::string& value) {
    if (!section.contains(key)) {
        return true;
    }
    if (!section[key].is_string()) {
        Logger::error("Configuration key " + path + key + " must be a string", "config");
        return false;
    }
    value = section[key].get<std::string>();
    return true;
}

bool readBool(const nlohmann::json& section, const std::string& path, const char* key,
              bool& value) {
    if (!section.contains(key)) {
        return true;
    }
    if (!section[key].is_boolean()) {
        Logger::error("Configuration key " + path + key + " must be a boolean", "config");
        return false;
    }
    value = section[key].get<bool>();
    return true;
}

bool readInt(const nlohmann::json& section, const std::string& path, const char* key,
             int min_value, int max_value, int& value) {
    if (!section.contains(key)) {
        return true;
    }
    const auto& node = section[key];
    if (!node.is_number_integer()) {
        Logger::error("Configuration key " + path + key + " must be an integer", "config");
        return false;
    }
    long long parsed = node.get<long long>();
    if (parsed < min_value || parsed > max_value) {
        Logger::error("Configuration key " + path + key + " out of range [" +
                      std::to_string(min_value) + ", " + std::to_string(max_value) + "]",
                      "config");
        return false;
    }
    value = static_cast<int>(parsed);
    return true;
}

bool readDouble(const nlohmann::json& section, const std::string& path, const char* key,
                double min_value, double max_value, double& value) {
    if (!section.contains(key)) {
        return true;
    }
    const auto& node = section[key];
    if (!node.is_number()) {
        Logger::error("Configuration key " + path + key + " must be a number", "config");
        return false;
    }
    double parsed = node.get<double>();
    if (!std::isfinite(parsed) || parsed < min_value || parsed > max_value) {
        Logger::error("Configuration key " + path + key + " out of range", "config");
        return false;
    }
    value = parsed;
    return true;
}

bool sectionOf(const nlohmann::json& document, const char* name, const nlohmann::json*& section) {
    section = nullptr;
    if (!document.contains(name)) {
        return true;
    }
    if (!document[name].is_object()) {
        Logger::error(std::string("Configuration section ") + name + " must be an object", "config");
        return false;
    }
    section = &document[name];
    return true;
}

} // namespace

bool applyConfiguration(const nlohmann::json& document, PalmSignatureConfig& config) {
    if (!document.is_object()) {
        Logger::error("Configuration root must be a JSON object", "config");
        return false;
    }

    warnUnknownKeys(document, "", {"storage", "detection", "matching", "logging"});

    PalmSignatureConfig result = config;
    const nlohmann::json* section = nullptr;

    if (!sectionOf(document, "storage", section)) return false;
    if (section) {
        warnUnknownKeys(*section, "storage.", {"data_directory"});
        if (!readString(*section, "storage.", "data_directory", result.storage.data_directory)) {
            return false;
        }
        if (result.storage.data_directory.empty()) {
            Logger::error("storage.data_directory must not be empty", "config");
            return false;
        }
    }

    if (!sectionOf(document, "detection", section)) return false;
    if (section) {
        warnUnknownKeys(*section, "detection.",
                        {"provider", "model_path", "timeout_ms", "num_threads", "input_size",
                         "min_hand_score", "normalized_output", "keep_landmarks"});
        DetectionSettings& d = result.detection;
        if (!readString(*section, "detection.", "provider", d.provider) ||
            !readString(*section, "detection.", "model_path", d.model_path) ||
            !readInt(*section, "detection.", "timeout_ms", 0, 600000, d.timeout_ms) ||
            !readInt(*section, "detection.", "num_threads", 1, 64, d.num_threads) ||
            !readInt(*section, "detection.", "input_size", 32, 4096, d.input_size) ||
            !readDouble(*section, "detection.", "min_hand_score", 0.0, 1.0, d.min_hand_score) ||
            !readBool(*section, "detection.", "normalized_output", d.normalized_output) ||
            !readBool(*section, "detection.", "keep_landmarks", d.keep_landmarks)) {
            return false;
        }
    }

    if (!sectionOf(document, "matching", section)) return false;
    if (section) {
        warnUnknownKeys(*section, "matching.", {"default_threshold"});
        if (!readDouble(*section, "matching.", "default_threshold", 0.0, 1.0e6,
                        result.matching.default_threshold)) {
            return false;
        }
    }

    if (!sectionOf(document, "logging", section)) return false;
    if (section) {
        warnUnknownKeys(*section, "logging.",
                        {"level", "file", "json", "color", "max_file_size_mb", "max_files"});
        LoggingSettings& l = result.logging;
        if (!readString(*section, "logging.", "level", l.level) ||
            !readString(*section, "logging.", "file", l.file) ||
            !readBool(*section, "logging.", "json", l.json) ||
            !readBool(*section, "logging.", "color", l.color) ||
            !readInt(*section, "logging.", "max_file_size_mb", 1, 4096, l.max_file_size_mb) ||
            !readInt(*section, "logging.", "max_files", 1, 100, l.max_files)) {
            return false;
        }
        LogLevel level;
        if (!parseLogLevel(l.level, level)) {
            Logger::error("Unknown log level: " + l.level, "config");
            return false;
        }
    }

    config = result;
    return true;
}

bool loadConfiguration(const std::string& config_path, PalmSignatureConfig& config) {
    Logger::info("Loading configuration from: " + config_path, "config");

    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        Logger::error("Failed to open configuration file: " + config_path, "config");
        return false;
    }

    std::ostringstream buffer;
    buffer << config_file.rdbuf();

    nlohmann::json document = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        Logger::error("Configuration file is not valid JSON: " + config_path, "config");
        return false;
    }

    if (!applyConfiguration(document, config)) {
        return false;
    }

    Logger::debug("Configuration loaded successfully", "config");
    return true;
}

nlohmann::json configToJson(const PalmSignatureConfig& config) {
    nlohmann::json j;
    j["storage"]["data_directory"] = config.storage.data_directory;

    j["detection"]["provider"] = config.detection.provider;
    j["detection"]["model_path"] = config.detection.model_path;
    j["detection"]["timeout_ms"] = config.detection.timeout_ms;
    j["detection"]["num_threads"] = config.detection.num_threads;
    j["detection"]["input_size"] = config.detection.input_size;
    j["detection"]["min_hand_score"] = config.detection.min_hand_score;
    j["detection"]["normalized_output"] = config.detection.normalized_output;
    j["detection"]["keep_landmarks"] = config.detection.keep_landmarks;

    j["matching"]["default_threshold"] = config.matching.default_threshold;

    j["logging"]["level"] = config.logging.level;
    j["logging"]["file"] = config.logging.file;
    j["logging"]["json"] = config.logging.json;
    j["logging"]["color"] = config.logging.color;
    j["logging"]["max_file_size_mb"] = config.logging.max_file_size_mb;
    j["logging"]["max_files"] = config.logging.max_files;
    return j;
}

bool toLoggerOptions(const LoggingSettings& settings, LoggerOptions& options) {
    LogLevel level;
    if (!parseLogLevel(settings.level, level)) {
        return false;
    }
    options.level = level;
    options.console = true;
    options.color = settings.color;
    options.json = settings.json;
    options.file_path = settings.file;
    options.max_file_size = static_cast<size_t>(settings.max_file_size_mb) * 1024 * 1024;
    options.max_files = settings.max_files;
    return true;
}
