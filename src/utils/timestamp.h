// timestamp.h - UTC timestamp helpers for persisted records
// Copyright (c) 2025 Biometric Security Systems

#ifndef TIMESTAMP_H
#define TIMESTAMP_H

#include <chrono>
#include <string>

using Timestamp = std::chrono::system_clock::time_point;

// Current UTC time truncated to microseconds so it survives a text round trip
Timestamp currentUtcTime();

// "YYYY-MM-DDTHH:MM:SS.ffffffZ"
std::string formatIso8601Utc(const Timestamp& when);

// Accepts an optional 1-9 digit fraction and no suffix, "Z" or "+00:00".
// Digits past the sixth are dropped.
bool parseIso8601Utc(const std::string& text, Timestamp& when);

#endif // TIMESTAMP_H
