// keypoint_provider.h - Hand keypoint detector interface
// Copyright (c) 2025 Biometric Security Systems

#ifndef KEYPOINT_PROVIDER_H
#define KEYPOINT_PROVIDER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <opencv2/core.hpp>

#include "hand_landmarks.h"

// Tuning passed through to concrete providers
struct ProviderSettings {
    int num_threads = 4;
    int input_size = 640;
    double min_hand_score = 0.25;
    bool normalized_output = true;
};

// Cancellation flag for a single detect() call. Copies share one flag, so the
// caller can cancel a call that is running on another thread.
class CancellationToken {
public:
    CancellationToken();

    void cancel() const { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Counts detections still running on worker threads
class DetectionWorkers {
public:
    DetectionWorkers() : active_(0) {}

    void enter();
    void leave();
    size_t active() const;

    // Returns false if workers are still running when timeout elapses
    bool waitIdle(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    size_t active_;
};

/**
 * Produces 21 ordered hand landmarks for an image.
 *
 * Implementations must tolerate concurrent detect() calls and should return
 * TIMEOUT early once the call's token is cancelled. A cancelled call never
 * affects other calls in flight.
 */
class KeypointProvider {
public:
    virtual ~KeypointProvider() = default;

    virtual bool initialize(const std::string& model_path) = 0;

    // image is BGR as returned by cv::imread
    virtual DetectionError detect(const cv::Mat& image, HandLandmarks& landmarks,
                                  const CancellationToken& token) = 0;

    virtual void release() = 0;
    virtual bool isInitialized() const = 0;
    virtual std::string name() const = 0;

    // Workers started by detectWithTimeout for this provider
    const std::shared_ptr<DetectionWorkers>& workers() const { return workers_; }

    bool waitForWorkers(std::chrono::milliseconds timeout) const {
        return workers_->waitIdle(timeout);
    }

protected:
    KeypointProvider() : workers_(std::make_shared<DetectionWorkers>()) {}

    KeypointProvider(const KeypointProvider&) = delete;
    KeypointProvider& operator=(const KeypointProvider&) = delete;
    KeypointProvider(KeypointProvider&&) = delete;
    KeypointProvider& operator=(KeypointProvider&&) = delete;

private:
    std::shared_ptr<DetectionWorkers> workers_;
};

// Returns nullptr for unknown type names or when the backend was not built in
std::shared_ptr<KeypointProvider> createKeypointProvider(const std::string& type_name,
                                                         const ProviderSettings& settings);

// Runs provider->detect on a worker thread. A zero timeout runs it inline.
// On timeout only this call's token is cancelled and its late result is
// dropped. The worker is registered with provider->workers() until it exits.
DetectionError detectWithTimeout(const std::shared_ptr<KeypointProvider>& provider,
                                 const cv::Mat& image,
                                 std::chrono::milliseconds timeout,
                                 HandLandmarks& landmarks);

#endif // KEYPOINT_PROVIDER_H
