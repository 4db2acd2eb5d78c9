// registration.h - Persisted palm registration record
// Copyright (c) 2025 Biometric Security Systems

#ifndef REGISTRATION_H
#define REGISTRATION_H

#include <string>
#include <nlohmann/json.hpp>

#include "../biometrics/template_builder.h"
#include "../utils/timestamp.h"

// One record per identity
struct Registration {
    std::string identity;
    std::string signature;
    DistanceVector normalized_distances;
    DistanceVector raw_distances;
    Timestamp registered_at;
    Timestamp last_used;

    bool operator==(const Registration& other) const {
        return identity == other.identity &&
               signature == other.signature &&
               normalized_distances == other.normalized_distances &&
               raw_distances == other.raw_distances &&
               registered_at == other.registered_at &&
               last_used == other.last_used;
    }
    bool operator!=(const Registration& other) const { return !(*this == other); }
};

struct RegistrationSummary {
    std::string identity;
    Timestamp registered_at;
    Timestamp last_used;
};

enum class RecordError {
    SUCCESS,
    NOT_AN_OBJECT,
    MISSING_FIELD,
    UNEXPECTED_FIELD,
    INVALID_FIELD
};

std::string recordErrorToString(RecordError error);

// Registration with registered_at == last_used == when
Registration makeRegistration(const std::string& identity, const PalmTemplate& palm_template,
                              const Timestamp& when);

// 16 lowercase hex characters
bool isValidSignature(const std::string& signature);

nlohmann::json registrationToJson(const Registration& registration);

// Strict: exactly the six record fields with the right types. detail names the
// offending field on failure.
RecordError registrationFromJson(const nlohmann::json& j, Registration& output,
                                 std::string& detail);

#endif // REGISTRATION_H
