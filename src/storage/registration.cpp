// registration.cpp - Persisted palm registration record
// Copyright (c) 2025 Biometric Security Systems

#include "registration.h"
#include "../utils/logger.h"

#include <array>
#include <cmath>

namespace {

const std::array<const char*, 6> RECORD_FIELDS = {
    "identity", "signature", "normalizedDistances", "rawDistances", "registeredAt", "lastUsed"
};

nlohmann::json distancesToJson(const DistanceVector& distances) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& entry : distances) {
        j[entry.first] = entry.second;
    }
    return j;
}

bool distancesFromJson(const nlohmann::json& j, DistanceVector& distances) {
    if (!j.is_object() || j.empty()) {
        return false;
    }
    DistanceVector result;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number()) {
            return false;
        }
        double value = it.value().get<double>();
        if (!std::isfinite(value) || value < 0.0) {
            return false;
        }
        result[it.key()] = value;
    }
    distances = std::move(result);
    return true;
}

bool timestampFromJson(const nlohmann::json& j, Timestamp& when) {
    return j.is_string() && parseIso8601Utc(j.get<std::string>(), when);
}

} // namespace

std::string recordErrorToString(RecordError error) {
    switch (error) {
        case RecordError::SUCCESS: return "SUCCESS";
        case RecordError::NOT_AN_OBJECT: return "NOT_AN_OBJECT";
        case RecordError::MISSING_FIELD: return "MISSING_FIELD";
        case RecordError::UNEXPECTED_FIELD: return "UNEXPECTED_FIELD";
        case RecordError::INVALID_FIELD: return "INVALID_FIELD";
        default: return "UNKNOWN";
    }
}

Registration makeRegistration(const std::string& identity, const PalmTemplate& palm_template,
                              const Timestamp& when) {
    Registration registration;
    registration.identity = identity;
    registration.signature = palm_template.signature;
    registration.normalized_distances = palm_template.normalized_distances;
    registration.raw_distances = palm_template.raw_distances;
    registration.registered_at = when;
    registration.last_used = when;
    return registration;
}

bool isValidSignature(const std::string& signature) {
    if (signature.size() != 16) {
        return false;
    }
    for (char c : signature) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) {
            return false;
        }
    }
    return true;
}

nlohmann::json registrationToJson(const Registration& registration) {
    nlohmann::json j;
    j["identity"] = registration.identity;
    j["signature"] = registration.signature;
    j["normalizedDistances"] = distancesToJson(registration.normalized_distances);
    j["rawDistances"] = distancesToJson(registration.raw_distances);
    j["registeredAt"] = formatIso8601Utc(registration.registered_at);
    j["lastUsed"] = formatIso8601Utc(registration.last_used);
    return j;
}

RecordError registrationFromJson(const nlohmann::json& j, Registration& output,
                                 std::string& detail) {
    if (!j.is_object()) {
        detail = "record is not a JSON object";
        return RecordError::NOT_AN_OBJECT;
    }

    for (const char* field : RECORD_FIELDS) {
        if (!j.contains(field)) {
            detail = field;
            return RecordError::MISSING_FIELD;
        }
    }
    if (j.size() != RECORD_FIELDS.size()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool known = false;
            for (const char* field : RECORD_FIELDS) {
                if (it.key() == field) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                detail = it.key();
                return RecordError::UNEXPECTED_FIELD;
            }
        }
    }

    Registration record;

    const auto& identity = j["identity"];
    if (!identity.is_string() || identity.get<std::string>().empty()) {
        detail = "identity";
        return RecordError::INVALID_FIELD;
    }
    record.identity = identity.get<std::string>();

    const auto& signature = j["signature"];
    if (!signature.is_string() || !isValidSignature(signature.get<std::string>())) {
        detail = "signature";
        return RecordError::INVALID_FIELD;
    }
    record.signature = signature.get<std::string>();

    if (!distancesFromJson(j["normalizedDistances"], record.normalized_distances)) {
        detail = "normalizedDistances";
        return RecordError::INVALID_FIELD;
    }
    if (!distancesFromJson(j["rawDistances"], record.raw_distances)) {
        detail = "rawDistances";
        return RecordError::INVALID_FIELD;
    }
    if (!timestampFromJson(j["registeredAt"], record.registered_at)) {
        detail = "registeredAt";
        return RecordError::INVALID_FIELD;
    }
    if (!timestampFromJson(j["lastUsed"], record.last_used)) {
        detail = "lastUsed";
        return RecordError::INVALID_FIELD;
    }

    if (record.normalized_distances.size() != static_cast<size_t>(HandConfig::NUM_KNUCKLE_PAIRS)) {
        Logger::warning("Record for " + record.identity + " has " +
                        std::to_string(record.normalized_distances.size()) +
                        " normalized distances", "store");
    }

    output = std::move(record);
    detail.clear();
    return RecordError::SUCCESS;
}
