// tflite_keypoint_provider.h - YOLO pose hand keypoint model on TensorFlow Lite
// Copyright (c) 2025 Biometric Security Systems

#ifndef TFLITE_KEYPOINT_PROVIDER_H
#define TFLITE_KEYPOINT_PROVIDER_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "keypoint_provider.h"

namespace tflite {
class FlatBufferModel;
class Interpreter;
}

/**
 * Single-class YOLO pose model exported to TFLite.
 *
 * Input is float32 [1, S, S, 3] RGB scaled to [0, 1]. Output is float32
 * [1, 68, N] or [1, N, 68] where each anchor holds the box (cx, cy, w, h),
 * the hand score, then 21 (x, y, confidence) triplets.
 */
class TfliteKeypointProvider : public KeypointProvider {
public:
    explicit TfliteKeypointProvider(const ProviderSettings& settings);
    ~TfliteKeypointProvider() override;

    bool initialize(const std::string& model_path) override;
    DetectionError detect(const cv::Mat& image, HandLandmarks& landmarks,
                          const CancellationToken& token) override;

    // Waits for detections still running on worker threads, then unloads
    void release() override;
    bool isInitialized() const override { return initialized_.load(); }
    std::string name() const override { return "yolo_pose_tflite"; }

private:
    struct Letterbox {
        cv::Mat input;
        double scale;
        int pad_x;
        int pad_y;
    };

    void unload();
    Letterbox letterbox(const cv::Mat& image, int size) const;
    DetectionError decodeOutput(const Letterbox& frame, HandLandmarks& landmarks);

    ProviderSettings settings_;
    int input_size_;

    std::unique_ptr<tflite::FlatBufferModel> model_;
    std::unique_ptr<tflite::Interpreter> interpreter_;

    // Guards input_size_, model_ and interpreter_
    std::mutex interpreter_mutex_;
    std::atomic<bool> initialized_;
};

#endif // TFLITE_KEYPOINT_PROVIDER_H
