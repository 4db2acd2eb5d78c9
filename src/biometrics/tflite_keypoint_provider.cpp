// tflite_keypoint_provider.cpp - YOLO pose hand keypoint model on TensorFlow Lite
// Copyright (c) 2025 Biometric Security Systems

#include "tflite_keypoint_provider.h"
#include "../utils/logger.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <opencv2/imgproc.hpp>

#include "tensorflow/lite/interpreter.h"
#include "tensorflow/lite/kernels/register.h"
#include "tensorflow/lite/model.h"

namespace {
    constexpr int BOX_VALUES = 4;
    constexpr int VALUES_PER_KEYPOINT = 3;
    constexpr int VALUES_PER_ANCHOR =
        BOX_VALUES + 1 + HandConfig::NUM_HAND_LANDMARKS * VALUES_PER_KEYPOINT;
    constexpr int LETTERBOX_PAD_VALUE = 114;
}

TfliteKeypointProvider::TfliteKeypointProvider(const ProviderSettings& settings)
    : settings_(settings)
    , input_size_(settings.input_size)
    , initialized_(false)
{}

// Detached workers hold their own reference, so none can be running here
TfliteKeypointProvider::~TfliteKeypointProvider() {
    unload();
}

bool TfliteKeypointProvider::initialize(const std::string& model_path) {
    std::lock_guard<std::mutex> lock(interpreter_mutex_);

    if (model_path.empty()) {
        Logger::error("No keypoint model path configured", "detector");
        return false;
    }

    model_ = tflite::FlatBufferModel::BuildFromFile(model_path.c_str());
    if (!model_) {
        Logger::error("Failed to load keypoint model: " + model_path, "detector");
        return false;
    }

    tflite::ops::builtin::BuiltinOpResolver resolver;
    tflite::InterpreterBuilder builder(*model_, resolver);
    builder.SetNumThreads(settings_.num_threads);

    if (builder(&interpreter_) != kTfLiteOk || !interpreter_) {
        Logger::error("Failed to build TFLite interpreter", "detector");
        model_.reset();
        return false;
    }

    if (interpreter_->AllocateTensors() != kTfLiteOk) {
        Logger::error("Failed to allocate TFLite tensors", "detector");
        interpreter_.reset();
        model_.reset();
        return false;
    }

    // Square NHWC input; the model dictates the size
    const TfLiteTensor* input = interpreter_->input_tensor(0);
    if (!input || input->type != kTfLiteFloat32 || input->dims->size != 4 ||
        input->dims->data[1] != input->dims->data[2] || input->dims->data[3] != 3) {
        Logger::error("Unsupported keypoint model input layout", "detector");
        interpreter_.reset();
        model_.reset();
        return false;
    }
    input_size_ = input->dims->data[1];

    initialized_ = true;
    Logger::info("Keypoint model loaded: " + model_path + " (input " +
                 std::to_string(input_size_) + "px)", "detector");
    return true;
}

void TfliteKeypointProvider::release() {
    waitForWorkers(std::chrono::milliseconds(0));
    unload();
}

void TfliteKeypointProvider::unload() {
    std::lock_guard<std::mutex> lock(interpreter_mutex_);
    interpreter_.reset();
    model_.reset();
    initialized_ = false;
}

TfliteKeypointProvider::Letterbox TfliteKeypointProvider::letterbox(const cv::Mat& image,
                                                                   int size) const {
    Letterbox frame;
    frame.scale = std::min(static_cast<double>(size) / image.cols,
                           static_cast<double>(size) / image.rows);

    int resized_w = std::max(1, static_cast<int>(std::round(image.cols * frame.scale)));
    int resized_h = std::max(1, static_cast<int>(std::round(image.rows * frame.scale)));
    frame.pad_x = (size - resized_w) / 2;
    frame.pad_y = (size - resized_h) / 2;

    cv::Mat rgb;
    if (image.channels() == 1) {
        cv::cvtColor(image, rgb, cv::COLOR_GRAY2RGB);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, rgb, cv::COLOR_BGRA2RGB);
    } else {
        cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
    }

    cv::Mat resized;
    cv::resize(rgb, resized, cv::Size(resized_w, resized_h), 0, 0, cv::INTER_LINEAR);

    cv::Mat padded(size, size, CV_8UC3,
                   cv::Scalar(LETTERBOX_PAD_VALUE, LETTERBOX_PAD_VALUE, LETTERBOX_PAD_VALUE));
    resized.copyTo(padded(cv::Rect(frame.pad_x, frame.pad_y, resized_w, resized_h)));

    padded.convertTo(frame.input, CV_32FC3, 1.0 / 255.0);
    return frame;
}

DetectionError TfliteKeypointProvider::detect(const cv::Mat& image, HandLandmarks& landmarks,
                                              const CancellationToken& token) {
    if (!initialized_.load()) {
        return DetectionError::UNAVAILABLE;
    }
    if (image.empty() || image.depth() != CV_8U) {
        return DetectionError::INVALID_IMAGE;
    }
    if (token.isCancelled()) {
        return DetectionError::TIMEOUT;
    }

    std::lock_guard<std::mutex> lock(interpreter_mutex_);
    if (!interpreter_) {
        return DetectionError::UNAVAILABLE;
    }
    // The caller may have given up while this call waited for the interpreter
    if (token.isCancelled()) {
        return DetectionError::TIMEOUT;
    }

    Letterbox frame = letterbox(image, input_size_);

    float* input_tensor = interpreter_->typed_input_tensor<float>(0);
    if (!input_tensor) {
        return DetectionError::UNAVAILABLE;
    }
    std::memcpy(input_tensor, frame.input.ptr<float>(),
                static_cast<size_t>(input_size_) * input_size_ * 3 * sizeof(float));

    if (interpreter_->Invoke() != kTfLiteOk) {
        Logger::error("TFLite inference failed", "detector");
        return DetectionError::UNAVAILABLE;
    }

    if (token.isCancelled()) {
        return DetectionError::TIMEOUT;
    }

    return decodeOutput(frame, landmarks);
}

DetectionError TfliteKeypointProvider::decodeOutput(const Letterbox& frame,
                                                    HandLandmarks& landmarks) {
    const TfLiteTensor* output = interpreter_->output_tensor(0);
    if (!output || output->type != kTfLiteFloat32 || output->dims->size != 3) {
        Logger::error("Unexpected keypoint output tensor", "detector");
        return DetectionError::UNAVAILABLE;
    }

    const float* data = interpreter_->typed_output_tensor<float>(0);
    int dim1 = output->dims->data[1];
    int dim2 = output->dims->data[2];

    // [1, 68, N] is the usual export; [1, N, 68] appears after transposition
    bool channels_first;
    int num_anchors;
    if (dim1 == VALUES_PER_ANCHOR) {
        channels_first = true;
        num_anchors = dim2;
    } else if (dim2 == VALUES_PER_ANCHOR) {
        channels_first = false;
        num_anchors = dim1;
    } else {
        Logger::error("Keypoint output has " + std::to_string(dim1) + "x" +
                      std::to_string(dim2) + " values, expected " +
                      std::to_string(VALUES_PER_ANCHOR) + " per anchor", "detector");
        return DetectionError::UNAVAILABLE;
    }

    auto value = [&](int anchor, int channel) -> float {
        return channels_first ? data[channel * num_anchors + anchor]
                              : data[anchor * VALUES_PER_ANCHOR + channel];
    };

    int best_anchor = -1;
    float best_score = 0.0f;
    for (int i = 0; i < num_anchors; ++i) {
        float score = value(i, BOX_VALUES);
        if (best_anchor < 0 || score > best_score) {
            best_anchor = i;
            best_score = score;
        }
    }

    if (best_anchor < 0 || best_score < settings_.min_hand_score) {
        Logger::debug("No hand above score threshold (best " + std::to_string(best_score) + ")",
                      "detector");
        return DetectionError::NOT_FOUND;
    }

    double coord_scale = settings_.normalized_output ? static_cast<double>(input_size_) : 1.0;
    for (int k = 0; k < HandConfig::NUM_HAND_LANDMARKS; ++k) {
        int base = BOX_VALUES + 1 + k * VALUES_PER_KEYPOINT;
        double x = value(best_anchor, base) * coord_scale;
        double y = value(best_anchor, base + 1) * coord_scale;
        double conf = value(best_anchor, base + 2);

        landmarks[k].position.x = (x - frame.pad_x) / frame.scale;
        landmarks[k].position.y = (y - frame.pad_y) / frame.scale;
        landmarks[k].confidence = conf;
    }

    return DetectionError::SUCCESS;
}
