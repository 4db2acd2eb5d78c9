// match_engine.h - Distance and nearest-neighbour search over palm templates
// Copyright (c) 2025 Biometric Security Systems

#ifndef MATCH_ENGINE_H
#define MATCH_ENGINE_H

#include <string>
#include <vector>

#include "template_builder.h"
#include "../storage/registration.h"

namespace MatchConfig {
    constexpr double DEFAULT_MATCH_THRESHOLD = 0.13;
}

struct MatchResult {
    bool has_candidate;
    size_t best_index;
    std::string best_identity;
    double best_distance;        // +inf when there is no candidate
    size_t candidates_compared;

    MatchResult();
};

class MatchEngine {
public:
    // Euclidean distance over the keys present in both vectors,
    // +infinity when they share none
    static double distance(const DistanceVector& a, const DistanceVector& b);

    static size_t commonMeasurementCount(const DistanceVector& a, const DistanceVector& b);

    // distance <= threshold; NaN never matches
    static bool decide(double best_distance, double threshold);

    // Display value only, not a probability
    static double confidence(double best_distance) { return 1.0 - best_distance; }

    // First strict minimum wins ties
    static MatchResult search(const DistanceVector& query,
                              const std::vector<Registration>& candidates);
};

#endif // MATCH_ENGINE_H
