// recognition_pipeline.cpp - Palm registration and recognition orchestration
// Copyright (c) 2025 Biometric Security Systems

#include "recognition_pipeline.h"
#include "../utils/logger.h"

#include <cmath>
#include <limits>
#include <sstream>

namespace {

std::string formatDistance(double value) {
    std::ostringstream oss;
    oss.precision(6);
    oss << std::fixed << value;
    return oss.str();
}

} // namespace

std::string pipelineStatusToString(PipelineStatus status) {
    switch (status) {
        case PipelineStatus::SUCCESS: return "SUCCESS";
        case PipelineStatus::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case PipelineStatus::INVALID_IDENTITY: return "INVALID_IDENTITY";
        case PipelineStatus::DETECTION_UNAVAILABLE: return "DETECTION_UNAVAILABLE";
        case PipelineStatus::DETECTION_FAILED: return "DETECTION_FAILED";
        case PipelineStatus::DETECTION_TIMEOUT: return "DETECTION_TIMEOUT";
        case PipelineStatus::DUPLICATE_REGISTRATION: return "DUPLICATE_REGISTRATION";
        case PipelineStatus::NOT_REGISTERED: return "NOT_REGISTERED";
        case PipelineStatus::STORAGE_IO_ERROR: return "STORAGE_IO_ERROR";
        case PipelineStatus::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

RecognitionDecision::RecognitionDecision()
    : status(PipelineStatus::INTERNAL_ERROR)
    , mode(RecognitionMode::OPEN_SET)
    , matched(false)
    , best_distance(std::numeric_limits<double>::infinity())
    , threshold(MatchConfig::DEFAULT_MATCH_THRESHOLD)
    , confidence(-std::numeric_limits<double>::infinity())
    , candidates_compared(0)
{}

// ============================================================================
// RECOGNITION PIPELINE IMPLEMENTATION
// ============================================================================

RecognitionPipeline::RecognitionPipeline(TemplateStore& store,
                                         std::shared_ptr<KeypointProvider> provider,
                                         const PipelineSettings& settings)
    : store_(store)
    , provider_(std::move(provider))
    , settings_(settings)
    , builder_(settings.keep_landmarks)
    , registrations_(0)
    , recognitions_(0)
    , matches_(0)
    , detection_failures_(0)
{}

PipelineStatus RecognitionPipeline::extractTemplate(const cv::Mat& image, PalmTemplate& output,
                                                    std::string& message) {
    if (image.empty()) {
        message = "Could not load image";
        return PipelineStatus::INVALID_ARGUMENT;
    }
    if (!provider_ || !provider_->isInitialized()) {
        message = "Palm recognition model not available";
        ++detection_failures_;
        return PipelineStatus::DETECTION_UNAVAILABLE;
    }

    HandLandmarks landmarks;
    DetectionError detection = detectWithTimeout(provider_, image, settings_.detection_timeout,
                                                 landmarks);
    switch (detection) {
        case DetectionError::SUCCESS:
            break;
        case DetectionError::INVALID_IMAGE:
            message = "Could not load image";
            return PipelineStatus::INVALID_ARGUMENT;
        case DetectionError::UNAVAILABLE:
            message = "Palm recognition model not available";
            ++detection_failures_;
            return PipelineStatus::DETECTION_UNAVAILABLE;
        case DetectionError::TIMEOUT:
            message = "Hand detection timed out";
            ++detection_failures_;
            return PipelineStatus::DETECTION_TIMEOUT;
        case DetectionError::NOT_FOUND:
        default:
            message = "Failed to detect hand keypoints in image. "
                      "Please ensure your palm is clearly visible.";
            ++detection_failures_;
            return PipelineStatus::DETECTION_FAILED;
    }

    BuildError built;
    try {
        built = builder_.build(landmarks, output);
    } catch (const std::exception& e) {
        Logger::error(std::string("Template build failed: ") + e.what(), "pipeline");
        message = "Internal error";
        return PipelineStatus::INTERNAL_ERROR;
    }

    if (built != BuildError::SUCCESS) {
        LOG_INFO_CAT("pipeline", "Rejected detection: " + buildErrorToString(built));
        switch (built) {
            case BuildError::INSUFFICIENT_CONFIDENCE:
                message = "Hand keypoints detected with insufficient confidence";
                break;
            default:
                message = "Hand geometry could not be normalized";
                break;
        }
        ++detection_failures_;
        return PipelineStatus::DETECTION_FAILED;
    }

    message = "Palm template created successfully";
    return PipelineStatus::SUCCESS;
}

RegistrationOutcome RecognitionPipeline::registerPalm(const cv::Mat& image,
                                                      const std::string& identity) {
    PERF_LOG("registerPalm");
    RegistrationOutcome outcome;

    if (!TemplateStore::isValidIdentity(identity)) {
        outcome.status = PipelineStatus::INVALID_IDENTITY;
        outcome.message = "Invalid identity";
        return outcome;
    }

    // Cheap early refusal; registerTemplate repeats the check under the lock
    if (store_.load(identity)) {
        outcome.status = PipelineStatus::DUPLICATE_REGISTRATION;
        outcome.message = "Palm already registered for this identity. "
                          "Please delete existing registration first.";
        return outcome;
    }

    PalmTemplate palm_template;
    outcome.status = extractTemplate(image, palm_template, outcome.message);
    if (outcome.status != PipelineStatus::SUCCESS) {
        return outcome;
    }

    return registerTemplate(palm_template, identity);
}

RegistrationOutcome RecognitionPipeline::registerTemplate(const PalmTemplate& palm_template,
                                                          const std::string& identity) {
    RegistrationOutcome outcome;

    switch (store_.registerTemplate(identity, palm_template, outcome.registration)) {
        case RegisterError::SUCCESS:
            outcome.status = PipelineStatus::SUCCESS;
            outcome.message = "Palm registered successfully";
            ++registrations_;
            LOG_INFO_CAT("pipeline", "Palm registered for " + identity);
            break;
        case RegisterError::ALREADY_REGISTERED:
            outcome.status = PipelineStatus::DUPLICATE_REGISTRATION;
            outcome.message = "Palm already registered for this identity. "
                              "Please delete existing registration first.";
            break;
        case RegisterError::INVALID_IDENTITY:
            outcome.status = PipelineStatus::INVALID_IDENTITY;
            outcome.message = "Invalid identity";
            break;
        case RegisterError::STORAGE_IO_ERROR:
        default:
            outcome.status = PipelineStatus::STORAGE_IO_ERROR;
            outcome.message = "Failed to save palm data";
            break;
    }
    return outcome;
}

RecognitionDecision RecognitionPipeline::recognize(const cv::Mat& image,
                                                   const std::optional<std::string>& identity,
                                                   std::optional<double> threshold) {
    PerformanceLogger perf("recognize");

    double effective_threshold = threshold ? *threshold : settings_.default_threshold;

    RecognitionDecision decision;
    decision.mode = identity ? RecognitionMode::TARGETED : RecognitionMode::OPEN_SET;
    decision.threshold = effective_threshold;

    if (std::isnan(effective_threshold) || effective_threshold < 0.0) {
        decision.status = PipelineStatus::INVALID_ARGUMENT;
        decision.message = "Threshold must be a non-negative number";
        return decision;
    }
    if (identity && !TemplateStore::isValidIdentity(*identity)) {
        decision.status = PipelineStatus::INVALID_IDENTITY;
        decision.message = "Invalid identity";
        return decision;
    }

    PalmTemplate probe;
    decision.status = extractTemplate(image, probe, decision.message);
    perf.checkpoint("template");
    if (decision.status != PipelineStatus::SUCCESS) {
        return decision;
    }

    decision = recognizeTemplate(probe, identity, effective_threshold);
    perf.addMetric("candidates", static_cast<double>(decision.candidates_compared));
    return decision;
}

RecognitionDecision RecognitionPipeline::recognizeTemplate(const PalmTemplate& probe,
                                                           const std::optional<std::string>& identity,
                                                           double threshold) {
    RecognitionDecision decision;
    decision.mode = identity ? RecognitionMode::TARGETED : RecognitionMode::OPEN_SET;
    decision.threshold = threshold;
    decision.probe_signature = probe.signature;

    if (std::isnan(threshold) || threshold < 0.0) {
        decision.status = PipelineStatus::INVALID_ARGUMENT;
        decision.message = "Threshold must be a non-negative number";
        return decision;
    }

    ++recognitions_;

    if (identity) {
        if (!TemplateStore::isValidIdentity(*identity)) {
            decision.status = PipelineStatus::INVALID_IDENTITY;
            decision.message = "Invalid identity";
            return decision;
        }

        Registration registration;
        switch (store_.loadChecked(*identity, registration)) {
            case StorageError::SUCCESS:
                break;
            case StorageError::NOT_FOUND:
                decision.status = PipelineStatus::NOT_REGISTERED;
                decision.message = "No palm registered for " + *identity;
                return decision;
            case StorageError::INVALID_IDENTITY:
                decision.status = PipelineStatus::INVALID_IDENTITY;
                decision.message = "Invalid identity";
                return decision;
            case StorageError::IO_ERROR:
            default:
                decision.status = PipelineStatus::STORAGE_IO_ERROR;
                decision.message = "Failed to read palm data";
                return decision;
        }

        decision.candidates_compared = 1;
        decision.best_distance = MatchEngine::distance(probe.normalized_distances,
                                                       registration.normalized_distances);
        decision.confidence = MatchEngine::confidence(decision.best_distance);
        decision.status = PipelineStatus::SUCCESS;

        if (MatchEngine::decide(decision.best_distance, threshold)) {
            decision.matched = true;
            decision.matched_identity = registration.identity;
            recordMatch(decision, registration.signature);
        } else {
            decision.message = "Palm not recognized";
        }

        LOG_DEBUG_CAT("pipeline", "Targeted distance to " + *identity + ": " +
                                  formatDistance(decision.best_distance));
        return decision;
    }

    std::vector<Registration> candidates = store_.loadAll();
    decision.status = PipelineStatus::SUCCESS;
    if (candidates.empty()) {
        decision.message = "No registered palms in database";
        return decision;
    }

    MatchResult result = MatchEngine::search(probe.normalized_distances, candidates);
    decision.candidates_compared = result.candidates_compared;
    decision.best_distance = result.best_distance;
    decision.confidence = MatchEngine::confidence(result.best_distance);

    LOG_DEBUG_CAT("pipeline", "Best match distance: " + formatDistance(result.best_distance) +
                              " over " + std::to_string(result.candidates_compared) +
                              " candidates");

    if (result.has_candidate && MatchEngine::decide(result.best_distance, threshold)) {
        decision.matched = true;
        decision.matched_identity = result.best_identity;
        recordMatch(decision, candidates[result.best_index].signature);
    } else {
        decision.message = "Palm not recognized";
    }
    return decision;
}

void RecognitionPipeline::recordMatch(RecognitionDecision& decision, const std::string& signature) {
    ++matches_;
    decision.message = "Palm recognized successfully";
    LOG_INFO_CAT("pipeline", "Palm recognized as " + decision.matched_identity +
                             " (distance " + formatDistance(decision.best_distance) + ")");

    StorageError touched = store_.touch(decision.matched_identity, signature, currentUtcTime());
    if (touched != StorageError::SUCCESS) {
        LOG_WARNING_CAT("pipeline", "Could not update lastUsed for " + decision.matched_identity +
                                    ": " + storageErrorToString(touched));
    }
}

DeletionOutcome RecognitionPipeline::deleteRegistration(const std::string& identity) {
    DeletionOutcome outcome;

    if (!TemplateStore::isValidIdentity(identity)) {
        outcome.status = PipelineStatus::INVALID_IDENTITY;
        outcome.message = "Invalid identity";
        return outcome;
    }

    outcome.deleted = store_.remove(identity);
    if (outcome.deleted) {
        outcome.status = PipelineStatus::SUCCESS;
        outcome.message = "Palm registration deleted successfully";
    } else {
        outcome.status = PipelineStatus::NOT_REGISTERED;
        outcome.message = "No palm registered for this identity";
    }
    return outcome;
}

std::vector<RegistrationSummary> RecognitionPipeline::listRegistrations() {
    return store_.listAll();
}

PipelineStatistics RecognitionPipeline::statistics() const {
    PipelineStatistics stats;
    stats.registrations = registrations_.load();
    stats.recognitions = recognitions_.load();
    stats.matches = matches_.load();
    stats.detection_failures = detection_failures_.load();
    return stats;
}
