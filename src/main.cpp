// main.cpp - palm_signature command line front end
// Copyright (c) 2025 Biometric Security Systems

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <sys/stat.h>

#include "app/palm_commands.h"
#include "biometrics/keypoint_provider.h"
#include "biometrics/recognition_pipeline.h"
#include "storage/template_store.h"
#include "utils/config.h"
#include "utils/logger.h"

namespace {

const char* DEFAULT_CONFIG_PATH = "palm_signature.json";

const std::chrono::milliseconds WORKER_SHUTDOWN_GRACE(10000);

const char* USAGE =
    "Usage: palm_signature [--config FILE] [--data-dir DIR] [--model FILE] [--log-level LEVEL] "
    "<register IMAGE IDENTITY | recognize IMAGE [IDENTITY] [THRESHOLD] | "
    "delete IDENTITY | list | config>";

struct CommandLine {
    std::string config_path;
    std::optional<std::string> data_dir;
    std::optional<std::string> model_path;
    std::optional<std::string> log_level;
    std::vector<std::string> positional;
};

int printResponse(const nlohmann::json& response, int exit_code) {
    std::cout << response.dump(2) << std::endl;
    return exit_code;
}

int usageError(const std::string& message) {
    nlohmann::json response;
    response["success"] = false;
    response["message"] = message;
    return printResponse(response, 1);
}

bool parseCommandLine(int argc, char* argv[], CommandLine& command_line, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto takeValue = [&](std::string& value) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--config") {
            if (!takeValue(command_line.config_path)) return false;
        } else if (arg == "--data-dir") {
            if (!takeValue(value)) return false;
            command_line.data_dir = value;
        } else if (arg == "--model") {
            if (!takeValue(value)) return false;
            command_line.model_path = value;
        } else if (arg == "--log-level") {
            if (!takeValue(value)) return false;
            command_line.log_level = value;
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            error = "Unknown option: " + arg;
            return false;
        } else {
            command_line.positional.push_back(arg);
        }
    }
    return true;
}

bool fileExists(const std::string& path) {
    struct stat info;
    return ::stat(path.c_str(), &info) == 0;
}

std::shared_ptr<KeypointProvider> createProvider(const DetectionSettings& detection) {
    ProviderSettings settings;
    settings.num_threads = detection.num_threads;
    settings.input_size = detection.input_size;
    settings.min_hand_score = detection.min_hand_score;
    settings.normalized_output = detection.normalized_output;

    auto provider = createKeypointProvider(detection.provider, settings);
    if (!provider) {
        return nullptr;
    }
    if (!provider->initialize(detection.model_path)) {
        Logger::error("Keypoint provider " + provider->name() + " failed to initialize", "detector");
        return nullptr;
    }
    return provider;
}

int run(int argc, char* argv[]) {
    CommandLine command_line;
    std::string error;
    if (!parseCommandLine(argc, argv, command_line, error)) {
        return usageError(error + ". " + USAGE);
    }
    if (command_line.positional.empty()) {
        return usageError(std::string("Missing command. ") + USAGE);
    }

    // Diagnostics go to stderr from the start; the configured sinks replace this
    LoggerOptions bootstrap;
    bootstrap.level = LogLevel::WARNING;
    Logger::getInstance().configure(bootstrap);

    PalmSignatureConfig config;
    if (!command_line.config_path.empty()) {
        if (!loadConfiguration(command_line.config_path, config)) {
            return usageError("Failed to load configuration: " + command_line.config_path);
        }
    } else if (fileExists(DEFAULT_CONFIG_PATH)) {
        if (!loadConfiguration(DEFAULT_CONFIG_PATH, config)) {
            return usageError(std::string("Failed to load configuration: ") + DEFAULT_CONFIG_PATH);
        }
    }

    if (command_line.data_dir) config.storage.data_directory = *command_line.data_dir;
    if (command_line.model_path) config.detection.model_path = *command_line.model_path;
    if (command_line.log_level) config.logging.level = *command_line.log_level;

    LoggerOptions logger_options;
    if (!toLoggerOptions(config.logging, logger_options)) {
        return usageError("Unknown log level: " + config.logging.level);
    }
    if (!Logger::getInstance().configure(logger_options)) {
        Logger::warning("Continuing without log file");
    }

    const std::vector<std::string>& args = command_line.positional;
    const std::string& command = args[0];

    if (command == "config") {
        if (args.size() != 1) {
            return usageError("Usage: palm_signature config");
        }
        return printResponse(configToJson(config), 0);
    }

    bool needs_detector = command == "register" || command == "recognize";
    if (command == "register" && args.size() != 3) {
        return usageError("Usage: palm_signature register <image_path> <identity>");
    }
    if (command == "recognize" && (args.size() < 2 || args.size() > 4)) {
        return usageError("Usage: palm_signature recognize <image_path> [identity] [threshold]");
    }
    if (command == "delete" && args.size() != 2) {
        return usageError("Usage: palm_signature delete <identity>");
    }
    if (command == "list" && args.size() != 1) {
        return usageError("Usage: palm_signature list");
    }
    if (!needs_detector && command != "delete" && command != "list") {
        return usageError("Unknown command: " + command +
                          ". Valid commands: register, recognize, delete, list, config");
    }

    std::optional<double> threshold;
    if (command == "recognize" && args.size() == 4) {
        try {
            size_t consumed = 0;
            threshold = std::stod(args[3], &consumed);
            if (consumed != args[3].size()) {
                return usageError("Invalid threshold: " + args[3]);
            }
        } catch (const std::exception&) {
            return usageError("Invalid threshold: " + args[3]);
        }
    }

    TemplateStore store(config.storage.data_directory);
    if (!store.open()) {
        nlohmann::json response;
        response["success"] = false;
        response["message"] = "Data directory is not usable: " + config.storage.data_directory;
        return printResponse(response, 1);
    }

    std::shared_ptr<KeypointProvider> provider;
    if (needs_detector) {
        provider = createProvider(config.detection);
    }

    PipelineSettings pipeline_settings;
    pipeline_settings.detection_timeout = std::chrono::milliseconds(config.detection.timeout_ms);
    pipeline_settings.default_threshold = config.matching.default_threshold;
    pipeline_settings.keep_landmarks = config.detection.keep_landmarks;

    RecognitionPipeline pipeline(store, provider, pipeline_settings);
    PalmCommandService service(pipeline);

    CommandResult result;
    if (command == "register") {
        result = service.registerPalm(args[1], args[2]);
    } else if (command == "recognize") {
        // An empty identity argument selects open-set search
        std::optional<std::string> identity;
        if (args.size() >= 3 && !args[2].empty()) {
            identity = args[2];
        }
        result = service.recognize(args[1], identity, threshold);
    } else if (command == "delete") {
        result = service.deleteRegistration(args[1]);
    } else {
        result = service.list();
    }

    int exit_code = printResponse(result.response, result.exit_code);

    // A timed-out detection may still be running; it must not outlive the
    // logger and other statics torn down after main returns
    if (provider && !provider->waitForWorkers(WORKER_SHUTDOWN_GRACE)) {
        Logger::warning("Detection still running at exit; skipping static teardown", "detector");
        Logger::getInstance().flush();
        std::cout.flush();
        std::quick_exit(exit_code);
    }

    Logger::getInstance().flush();
    return exit_code;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        Logger::critical(std::string("Unhandled error: ") + e.what());
        nlohmann::json response;
        response["success"] = false;
        response["message"] = std::string("Error: ") + e.what();
        std::cout << response.dump(2) << std::endl;
        return 1;
    }
}
