// hand_landmarks.h - Hand landmark types shared by detection and templating
// Copyright (c) 2025 Biometric Security Systems

#ifndef HAND_LANDMARKS_H
#define HAND_LANDMARKS_H

#include <array>
#include <string>
#include <opencv2/core.hpp>

// Configuration constants
namespace HandConfig {
    constexpr int NUM_HAND_LANDMARKS = 21;
    constexpr int NUM_KNUCKLE_POINTS = 5;
    constexpr int NUM_KNUCKLE_PAIRS = NUM_KNUCKLE_POINTS * (NUM_KNUCKLE_POINTS - 1) / 2;
    constexpr double MIN_KNUCKLE_CONFIDENCE = 0.5;
    constexpr const char* REFERENCE_PAIR_KEY = "middle_knuckle_wrist";
}

// One detected keypoint in image pixel coordinates
struct Landmark {
    cv::Point2d position;
    double confidence;

    Landmark() : position(0.0, 0.0), confidence(0.0) {}
    Landmark(double x, double y, double conf) : position(x, y), confidence(conf) {}
};

// Indexed in the 21-point hand topology order (0 = wrist)
using HandLandmarks = std::array<Landmark, HandConfig::NUM_HAND_LANDMARKS>;

// Landmarks used for the geometric signature
enum class KnucklePoint {
    WRIST,
    INDEX_KNUCKLE,
    MIDDLE_KNUCKLE,
    RING_KNUCKLE,
    PINKY_KNUCKLE
};

constexpr std::array<KnucklePoint, HandConfig::NUM_KNUCKLE_POINTS> ALL_KNUCKLE_POINTS = {
    KnucklePoint::WRIST,
    KnucklePoint::INDEX_KNUCKLE,
    KnucklePoint::MIDDLE_KNUCKLE,
    KnucklePoint::RING_KNUCKLE,
    KnucklePoint::PINKY_KNUCKLE
};

inline int knuckleLandmarkIndex(KnucklePoint point) {
    switch (point) {
        case KnucklePoint::WRIST: return 0;
        case KnucklePoint::INDEX_KNUCKLE: return 5;
        case KnucklePoint::MIDDLE_KNUCKLE: return 9;
        case KnucklePoint::RING_KNUCKLE: return 13;
        case KnucklePoint::PINKY_KNUCKLE: return 17;
    }
    return 0;
}

inline std::string knuckleName(KnucklePoint point) {
    switch (point) {
        case KnucklePoint::WRIST: return "wrist";
        case KnucklePoint::INDEX_KNUCKLE: return "index_knuckle";
        case KnucklePoint::MIDDLE_KNUCKLE: return "middle_knuckle";
        case KnucklePoint::RING_KNUCKLE: return "ring_knuckle";
        case KnucklePoint::PINKY_KNUCKLE: return "pinky_knuckle";
    }
    return "unknown";
}

// Order-independent key for an unordered pair of names
inline std::string pairKey(const std::string& a, const std::string& b) {
    return a < b ? a + "_" + b : b + "_" + a;
}

// Detection error codes
enum class DetectionError {
    SUCCESS,
    UNAVAILABLE,
    NOT_FOUND,
    TIMEOUT,
    INVALID_IMAGE
};

inline std::string detectionErrorToString(DetectionError error) {
    switch (error) {
        case DetectionError::SUCCESS: return "SUCCESS";
        case DetectionError::UNAVAILABLE: return "UNAVAILABLE";
        case DetectionError::NOT_FOUND: return "NOT_FOUND";
        case DetectionError::TIMEOUT: return "TIMEOUT";
        case DetectionError::INVALID_IMAGE: return "INVALID_IMAGE";
        default: return "UNKNOWN";
    }
}

#endif // HAND_LANDMARKS_H
