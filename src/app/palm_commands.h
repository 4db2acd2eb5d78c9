// palm_commands.h - JSON command surface over the recognition pipeline
// Copyright (c) 2025 Biometric Security Systems

#ifndef PALM_COMMANDS_H
#define PALM_COMMANDS_H

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "../biometrics/recognition_pipeline.h"

struct CommandResult {
    nlohmann::json response;
    int exit_code = 0;          // 1 only for internal failures
};

// Every call returns a response object; exceptions never escape.
class PalmCommandService {
public:
    explicit PalmCommandService(RecognitionPipeline& pipeline);

    CommandResult registerPalm(const std::string& image_path, const std::string& identity);
    CommandResult recognize(const std::string& image_path,
                            const std::optional<std::string>& identity,
                            std::optional<double> threshold);
    CommandResult deleteRegistration(const std::string& identity);
    CommandResult list();

private:
    // Empty image and a filled message when the file is missing or unreadable
    cv::Mat loadImage(const std::string& image_path, std::string& message) const;

    static CommandResult failure(const std::string& message);
    static CommandResult internalError(const std::string& context, const std::exception& e);

    RecognitionPipeline& pipeline_;
};

#endif // PALM_COMMANDS_H
