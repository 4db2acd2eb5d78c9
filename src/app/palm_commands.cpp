// palm_commands.cpp - JSON command surface over the recognition pipeline
// Copyright (c) 2025 Biometric Security Systems

#include "palm_commands.h"
#include "../utils/logger.h"

#include <cmath>
#include <sys/stat.h>
#include <opencv2/imgcodecs.hpp>

namespace {

nlohmann::json finiteOrNull(double value) {
    if (std::isfinite(value)) {
        return value;
    }
    return nullptr;
}

} // namespace

PalmCommandService::PalmCommandService(RecognitionPipeline& pipeline)
    : pipeline_(pipeline)
{}

CommandResult PalmCommandService::failure(const std::string& message) {
    CommandResult result;
    result.response["success"] = false;
    result.response["message"] = message;
    return result;
}

CommandResult PalmCommandService::internalError(const std::string& context,
                                                const std::exception& e) {
    Logger::error(context + " failed: " + e.what());
    CommandResult result = failure("Internal error");
    result.exit_code = 1;
    return result;
}

cv::Mat PalmCommandService::loadImage(const std::string& image_path, std::string& message) const {
    struct stat info;
    if (image_path.empty() || ::stat(image_path.c_str(), &info) != 0 || !S_ISREG(info.st_mode)) {
        message = "Image not found: " + image_path;
        return cv::Mat();
    }

    cv::Mat image = cv::imread(image_path, cv::IMREAD_COLOR);
    if (image.empty()) {
        message = "Could not load image";
    }
    return image;
}

CommandResult PalmCommandService::registerPalm(const std::string& image_path,
                                               const std::string& identity) {
    try {
        std::string message;
        cv::Mat image = loadImage(image_path, message);
        if (image.empty()) {
            return failure(message);
        }

        RegistrationOutcome outcome = pipeline_.registerPalm(image, identity);

        CommandResult result;
        result.response["success"] = outcome.status == PipelineStatus::SUCCESS;
        result.response["message"] = outcome.message;
        if (outcome.status == PipelineStatus::SUCCESS) {
            result.response["data"] = {
                {"identity", outcome.registration.identity},
                {"signature", outcome.registration.signature},
                {"registeredAt", formatIso8601Utc(outcome.registration.registered_at)}
            };
        }
        if (outcome.status == PipelineStatus::INTERNAL_ERROR) {
            result.exit_code = 1;
        }
        return result;
    } catch (const std::exception& e) {
        return internalError("register", e);
    }
}

CommandResult PalmCommandService::recognize(const std::string& image_path,
                                            const std::optional<std::string>& identity,
                                            std::optional<double> threshold) {
    try {
        std::string message;
        cv::Mat image = loadImage(image_path, message);
        if (image.empty()) {
            CommandResult result = failure(message);
            result.response["match"] = false;
            return result;
        }

        RecognitionDecision decision = pipeline_.recognize(image, identity, threshold);

        CommandResult result;
        result.response["success"] = decision.status == PipelineStatus::SUCCESS;
        result.response["match"] = decision.matched;
        result.response["message"] = decision.message;

        if (decision.matched) {
            result.response["data"] = {
                {"identity", decision.matched_identity},
                {"distance", finiteOrNull(decision.best_distance)},
                {"confidence", finiteOrNull(decision.confidence)},
                {"threshold", decision.threshold}
            };
        } else if (decision.status == PipelineStatus::SUCCESS && decision.candidates_compared > 0) {
            result.response["data"] = {
                {"distance", finiteOrNull(decision.best_distance)},
                {"threshold", decision.threshold}
            };
        }
        if (decision.status == PipelineStatus::INTERNAL_ERROR) {
            result.exit_code = 1;
        }
        return result;
    } catch (const std::exception& e) {
        CommandResult result = internalError("recognize", e);
        result.response["match"] = false;
        return result;
    }
}

CommandResult PalmCommandService::deleteRegistration(const std::string& identity) {
    try {
        DeletionOutcome outcome = pipeline_.deleteRegistration(identity);

        CommandResult result;
        result.response["success"] = outcome.deleted;
        result.response["message"] = outcome.message;
        return result;
    } catch (const std::exception& e) {
        return internalError("delete", e);
    }
}

CommandResult PalmCommandService::list() {
    try {
        std::vector<RegistrationSummary> summaries = pipeline_.listRegistrations();

        nlohmann::json records = nlohmann::json::array();
        for (const auto& summary : summaries) {
            records.push_back({
                {"identity", summary.identity},
                {"registeredAt", formatIso8601Utc(summary.registered_at)},
                {"lastUsed", formatIso8601Utc(summary.last_used)}
            });
        }

        CommandResult result;
        result.response["success"] = true;
        result.response["count"] = summaries.size();
        result.response["records"] = records;
        return result;
    } catch (const std::exception& e) {
        return internalError("list", e);
    }
}
