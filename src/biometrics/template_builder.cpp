// template_builder.cpp - Knuckle geometry templates and palm signatures
// Copyright (c) 2025 Biometric Security Systems

#include "template_builder.h"
#include "../utils/logger.h"

#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>

namespace {
    constexpr size_t SIGNATURE_LENGTH = 16;
}

std::string buildErrorToString(BuildError error) {
    switch (error) {
        case BuildError::SUCCESS: return "SUCCESS";
        case BuildError::INSUFFICIENT_CONFIDENCE: return "INSUFFICIENT_CONFIDENCE";
        case BuildError::MISSING_REFERENCE: return "MISSING_REFERENCE";
        case BuildError::DEGENERATE_REFERENCE: return "DEGENERATE_REFERENCE";
        default: return "UNKNOWN";
    }
}

TemplateBuilder::TemplateBuilder(bool keep_landmarks)
    : keep_landmarks_(keep_landmarks)
{}

BuildError TemplateBuilder::build(const HandLandmarks& landmarks, PalmTemplate& output) const {
    for (KnucklePoint point : ALL_KNUCKLE_POINTS) {
        const Landmark& landmark = landmarks[knuckleLandmarkIndex(point)];
        // NaN confidence fails this check as well
        if (!(landmark.confidence >= HandConfig::MIN_KNUCKLE_CONFIDENCE)) {
            Logger::debug("Low confidence for " + knuckleName(point) + ": " +
                          std::to_string(landmark.confidence), "pipeline");
            return BuildError::INSUFFICIENT_CONFIDENCE;
        }
    }

    DistanceVector raw = computeKnuckleDistances(landmarks);
    DistanceVector normalized;
    BuildError result = normalizeDistances(raw, normalized);
    if (result != BuildError::SUCCESS) {
        return result;
    }

    PalmTemplate built;
    built.signature = deriveSignature(normalized);
    built.raw_distances = std::move(raw);
    built.normalized_distances = std::move(normalized);
    if (keep_landmarks_) {
        built.landmarks = landmarks;
    }
    built.created_at = currentUtcTime();

    output = std::move(built);
    return BuildError::SUCCESS;
}

DistanceVector TemplateBuilder::computeKnuckleDistances(const HandLandmarks& landmarks) {
    DistanceVector distances;
    for (size_t i = 0; i < ALL_KNUCKLE_POINTS.size(); ++i) {
        for (size_t j = i + 1; j < ALL_KNUCKLE_POINTS.size(); ++j) {
            KnucklePoint a = ALL_KNUCKLE_POINTS[i];
            KnucklePoint b = ALL_KNUCKLE_POINTS[j];
            const cv::Point2d& pa = landmarks[knuckleLandmarkIndex(a)].position;
            const cv::Point2d& pb = landmarks[knuckleLandmarkIndex(b)].position;
            distances[pairKey(knuckleName(a), knuckleName(b))] = cv::norm(pa - pb);
        }
    }
    return distances;
}

BuildError TemplateBuilder::normalizeDistances(const DistanceVector& raw,
                                               DistanceVector& normalized) {
    auto reference_it = raw.find(HandConfig::REFERENCE_PAIR_KEY);
    if (reference_it == raw.end()) {
        return BuildError::MISSING_REFERENCE;
    }

    double reference = reference_it->second;
    if (!std::isfinite(reference) || reference <= 0.0) {
        Logger::debug("Degenerate reference distance: " + std::to_string(reference), "pipeline");
        return BuildError::DEGENERATE_REFERENCE;
    }

    DistanceVector result;
    for (const auto& entry : raw) {
        result[entry.first] = entry.second / reference;
    }

    normalized = std::move(result);
    return BuildError::SUCCESS;
}

std::string TemplateBuilder::canonicalString(const DistanceVector& distances) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(6);

    bool first = true;
    for (const auto& entry : distances) {
        if (!first) oss << "|";
        oss << entry.first << ":" << entry.second;
        first = false;
    }
    return oss.str();
}

std::string TemplateBuilder::deriveSignature(const DistanceVector& normalized) {
    std::string canonical = canonicalString(normalized);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_Digest(canonical.data(), canonical.size(), digest, &digest_length,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char* hex_digits = "0123456789abcdef";
    std::string signature;
    signature.reserve(SIGNATURE_LENGTH);
    for (unsigned int i = 0; i < digest_length && signature.size() < SIGNATURE_LENGTH; ++i) {
        signature.push_back(hex_digits[digest[i] >> 4]);
        signature.push_back(hex_digits[digest[i] & 0x0f]);
    }
    return signature;
}
