// recognition_pipeline.h - Palm registration and recognition orchestration
// Copyright (c) 2025 Biometric Security Systems

#ifndef RECOGNITION_PIPELINE_H
#define RECOGNITION_PIPELINE_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "keypoint_provider.h"
#include "match_engine.h"
#include "template_builder.h"
#include "../storage/template_store.h"

enum class PipelineStatus {
    SUCCESS,
    INVALID_ARGUMENT,
    INVALID_IDENTITY,
    DETECTION_UNAVAILABLE,
    DETECTION_FAILED,
    DETECTION_TIMEOUT,
    DUPLICATE_REGISTRATION,
    NOT_REGISTERED,
    STORAGE_IO_ERROR,
    INTERNAL_ERROR
};

std::string pipelineStatusToString(PipelineStatus status);

enum class RecognitionMode {
    TARGETED,
    OPEN_SET
};

struct PipelineSettings {
    std::chrono::milliseconds detection_timeout{5000};
    double default_threshold = MatchConfig::DEFAULT_MATCH_THRESHOLD;
    bool keep_landmarks = false;
};

struct RegistrationOutcome {
    PipelineStatus status = PipelineStatus::INTERNAL_ERROR;
    Registration registration;
    std::string message;
};

struct RecognitionDecision {
    PipelineStatus status;
    RecognitionMode mode;
    bool matched;
    std::string matched_identity;
    double best_distance;
    double threshold;
    double confidence;          // 1 - best_distance, display only
    size_t candidates_compared;
    std::string probe_signature;
    std::string message;

    RecognitionDecision();
};

struct DeletionOutcome {
    PipelineStatus status = PipelineStatus::INTERNAL_ERROR;
    bool deleted = false;
    std::string message;
};

struct PipelineStatistics {
    uint64_t registrations = 0;
    uint64_t recognitions = 0;
    uint64_t matches = 0;
    uint64_t detection_failures = 0;
};

/**
 * Image -> landmarks -> template -> store or compare.
 *
 * The store is borrowed and must outlive the pipeline. A null provider makes
 * every image based call report DETECTION_UNAVAILABLE; template based calls
 * still work.
 */
class RecognitionPipeline {
public:
    RecognitionPipeline(TemplateStore& store,
                        std::shared_ptr<KeypointProvider> provider,
                        const PipelineSettings& settings = PipelineSettings());

    PipelineStatus extractTemplate(const cv::Mat& image, PalmTemplate& output,
                                   std::string& message);

    RegistrationOutcome registerPalm(const cv::Mat& image, const std::string& identity);
    RegistrationOutcome registerTemplate(const PalmTemplate& palm_template,
                                         const std::string& identity);

    // No identity means open-set; no threshold means the configured default
    RecognitionDecision recognize(const cv::Mat& image,
                                  const std::optional<std::string>& identity = std::nullopt,
                                  std::optional<double> threshold = std::nullopt);
    RecognitionDecision recognizeTemplate(const PalmTemplate& probe,
                                          const std::optional<std::string>& identity,
                                          double threshold);

    DeletionOutcome deleteRegistration(const std::string& identity);
    std::vector<RegistrationSummary> listRegistrations();

    PipelineStatistics statistics() const;
    const PipelineSettings& settings() const { return settings_; }

private:
    void recordMatch(RecognitionDecision& decision, const std::string& signature);

    TemplateStore& store_;
    std::shared_ptr<KeypointProvider> provider_;
    PipelineSettings settings_;
    TemplateBuilder builder_;

    std::atomic<uint64_t> registrations_;
    std::atomic<uint64_t> recognitions_;
    std::atomic<uint64_t> matches_;
    std::atomic<uint64_t> detection_failures_;
};

#endif // RECOGNITION_PIPELINE_H
