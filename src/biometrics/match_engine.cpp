// match_engine.cpp - Distance and nearest-neighbour search over palm templates
// Copyright (c) 2025 Biometric Security Systems

#include "match_engine.h"

#include <cmath>
#include <limits>
#include <Eigen/Dense>

MatchResult::MatchResult()
    : has_candidate(false)
    , best_index(0)
    , best_distance(std::numeric_limits<double>::infinity())
    , candidates_compared(0)
{}

size_t MatchEngine::commonMeasurementCount(const DistanceVector& a, const DistanceVector& b) {
    size_t count = 0;
    auto it_a = a.begin();
    auto it_b = b.begin();
    while (it_a != a.end() && it_b != b.end()) {
        if (it_a->first < it_b->first) {
            ++it_a;
        } else if (it_b->first < it_a->first) {
            ++it_b;
        } else {
            ++count;
            ++it_a;
            ++it_b;
        }
    }
    return count;
}

double MatchEngine::distance(const DistanceVector& a, const DistanceVector& b) {
    size_t common = commonMeasurementCount(a, b);
    if (common == 0) {
        return std::numeric_limits<double>::infinity();
    }

    // Both maps iterate in key order, so a merge walk pairs the shared keys
    Eigen::VectorXd diff(static_cast<Eigen::Index>(common));
    Eigen::Index row = 0;
    auto it_a = a.begin();
    auto it_b = b.begin();
    while (it_a != a.end() && it_b != b.end()) {
        if (it_a->first < it_b->first) {
            ++it_a;
        } else if (it_b->first < it_a->first) {
            ++it_b;
        } else {
            diff(row++) = it_a->second - it_b->second;
            ++it_a;
            ++it_b;
        }
    }

    return diff.norm();
}

bool MatchEngine::decide(double best_distance, double threshold) {
    if (std::isnan(best_distance) || std::isnan(threshold)) {
        return false;
    }
    return best_distance <= threshold;
}

MatchResult MatchEngine::search(const DistanceVector& query,
                                const std::vector<Registration>& candidates) {
    MatchResult result;
    for (size_t i = 0; i < candidates.size(); ++i) {
        double d = distance(query, candidates[i].normalized_distances);
        ++result.candidates_compared;
        if (std::isfinite(d) && (!result.has_candidate || d < result.best_distance)) {
            result.has_candidate = true;
            result.best_index = i;
            result.best_identity = candidates[i].identity;
            result.best_distance = d;
        }
    }
    return result;
}
