// template_builder.h - Knuckle geometry templates and palm signatures
// Copyright (c) 2025 Biometric Security Systems

#ifndef TEMPLATE_BUILDER_H
#define TEMPLATE_BUILDER_H

#include <map>
#include <optional>
#include <string>

#include "hand_landmarks.h"
#include "../utils/timestamp.h"

// Pair key -> distance, iterated in ascending key order
using DistanceVector = std::map<std::string, double>;

struct PalmTemplate {
    std::string signature;               // 16 lowercase hex chars
    DistanceVector raw_distances;        // pixels
    DistanceVector normalized_distances; // relative to REFERENCE_PAIR_KEY
    std::optional<HandLandmarks> landmarks;
    Timestamp created_at;
};

enum class BuildError {
    SUCCESS,
    INSUFFICIENT_CONFIDENCE,
    MISSING_REFERENCE,
    DEGENERATE_REFERENCE
};

std::string buildErrorToString(BuildError error);

class TemplateBuilder {
public:
    explicit TemplateBuilder(bool keep_landmarks = false);

    BuildError build(const HandLandmarks& landmarks, PalmTemplate& output) const;

    // Euclidean distance for every unordered pair of knuckle points
    static DistanceVector computeKnuckleDistances(const HandLandmarks& landmarks);

    // Divides every entry by the reference pair distance
    static BuildError normalizeDistances(const DistanceVector& raw, DistanceVector& normalized);

    // "key:value|key:value" with six decimal places, keys ascending
    static std::string canonicalString(const DistanceVector& distances);

    // First 16 hex chars of SHA-256 over canonicalString. Throws
    // std::runtime_error if the digest cannot be computed.
    static std::string deriveSignature(const DistanceVector& normalized);

private:
    bool keep_landmarks_;
};

#endif // TEMPLATE_BUILDER_H
