// keypoint_provider.cpp - Provider factory and timeout wrapper
// Copyright (c) 2025 Biometric Security Systems

#include "keypoint_provider.h"
#include "../utils/logger.h"

#include <algorithm>
#include <cctype>
#include <future>
#include <system_error>
#include <thread>
#include <utility>

#ifdef PALMSIG_HAS_TFLITE
#include "tflite_keypoint_provider.h"
#endif

namespace {

using DetectionOutcome = std::pair<DetectionError, HandLandmarks>;

DetectionOutcome runDetection(const std::shared_ptr<KeypointProvider>& provider,
                              const cv::Mat& image,
                              const CancellationToken& token) {
    DetectionOutcome outcome;
    outcome.first = DetectionError::UNAVAILABLE;
    try {
        outcome.first = provider->detect(image, outcome.second, token);
    } catch (const std::exception& e) {
        Logger::error(std::string("Keypoint provider threw: ") + e.what(), "detector");
        outcome.first = DetectionError::UNAVAILABLE;
    }
    return outcome;
}

} // namespace

// ============================================================================
// CANCELLATION AND WORKER TRACKING
// ============================================================================

CancellationToken::CancellationToken()
    : flag_(std::make_shared<std::atomic<bool>>(false))
{}

void DetectionWorkers::enter() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++active_;
}

void DetectionWorkers::leave() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ > 0) {
        --active_;
    }
    idle_.notify_all();
}

size_t DetectionWorkers::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool DetectionWorkers::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout.count() <= 0) {
        idle_.wait(lock, [this]() { return active_ == 0; });
        return true;
    }
    return idle_.wait_for(lock, timeout, [this]() { return active_ == 0; });
}

// ============================================================================
// FACTORY AND TIMEOUT WRAPPER
// ============================================================================

std::shared_ptr<KeypointProvider> createKeypointProvider(const std::string& type_name,
                                                         const ProviderSettings& settings) {
    std::string lower_name = type_name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower_name == "yolo_pose_tflite" || lower_name == "tflite") {
#ifdef PALMSIG_HAS_TFLITE
        return std::make_shared<TfliteKeypointProvider>(settings);
#else
        (void)settings;
        Logger::warning("TensorFlow Lite support was not built in", "detector");
        return nullptr;
#endif
    }

    Logger::warning("Unknown keypoint provider: " + type_name, "detector");
    return nullptr;
}

DetectionError detectWithTimeout(const std::shared_ptr<KeypointProvider>& provider,
                                 const cv::Mat& image,
                                 std::chrono::milliseconds timeout,
                                 HandLandmarks& landmarks) {
    if (!provider || !provider->isInitialized()) {
        return DetectionError::UNAVAILABLE;
    }
    if (image.empty()) {
        return DetectionError::INVALID_IMAGE;
    }

    CancellationToken token;

    if (timeout.count() <= 0) {
        DetectionOutcome outcome = runDetection(provider, image, token);
        if (outcome.first == DetectionError::SUCCESS) {
            landmarks = outcome.second;
        }
        return outcome.first;
    }

    // The worker owns its own copy of the image and the provider so that an
    // abandoned detection never touches caller state.
    auto promise = std::make_shared<std::promise<DetectionOutcome>>();
    std::future<DetectionOutcome> future = promise->get_future();
    std::shared_ptr<DetectionWorkers> workers = provider->workers();

    workers->enter();
    try {
        std::thread worker([owner = provider, owned_image = image.clone(),
                            promise, token, workers]() mutable {
            DetectionOutcome outcome = runDetection(owner, owned_image, token);
            // Nothing the provider owns may be touched after leave()
            owner.reset();
            owned_image.release();
            promise->set_value(outcome);
            workers->leave();
        });
        worker.detach();
    } catch (const std::system_error& e) {
        workers->leave();
        Logger::error(std::string("Failed to start detection worker: ") + e.what(), "detector");
        return DetectionError::UNAVAILABLE;
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        token.cancel();
        Logger::warning("Detection timed out after " + std::to_string(timeout.count()) + "ms",
                        "detector");
        return DetectionError::TIMEOUT;
    }

    DetectionOutcome outcome = future.get();
    if (outcome.first == DetectionError::SUCCESS) {
        landmarks = outcome.second;
    }
    return outcome.first;
}
