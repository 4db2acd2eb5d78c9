// timestamp.cpp - UTC timestamp helpers
// Copyright (c) 2025 Biometric Security Systems

#include "timestamp.h"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace {

bool readDigits(const std::string& text, size_t pos, size_t count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    return true;
}

} // namespace

Timestamp currentUtcTime() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::time_point_cast<std::chrono::microseconds>(now);
}

std::string formatIso8601Utc(const Timestamp& when) {
    auto micros_since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(
        when.time_since_epoch()).count();

    long long seconds = micros_since_epoch / 1000000;
    long long micros = micros_since_epoch % 1000000;
    if (micros < 0) {
        micros += 1000000;
        seconds -= 1;
    }

    std::time_t time_value = static_cast<std::time_t>(seconds);
    std::tm tm_buf;
    gmtime_r(&time_value, &tm_buf);

    char date_part[32];
    std::strftime(date_part, sizeof(date_part), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    char result[48];
    std::snprintf(result, sizeof(result), "%s.%06lldZ", date_part, micros);
    return result;
}

bool parseIso8601Utc(const std::string& text, Timestamp& when) {
    // YYYY-MM-DDTHH:MM:SS is 19 characters
    if (text.size() < 19) {
        return false;
    }

    int year, month, day, hour, minute, second;
    if (!readDigits(text, 0, 4, year) || text[4] != '-' ||
        !readDigits(text, 5, 2, month) || text[7] != '-' ||
        !readDigits(text, 8, 2, day) || text[10] != 'T' ||
        !readDigits(text, 11, 2, hour) || text[13] != ':' ||
        !readDigits(text, 14, 2, minute) || text[16] != ':' ||
        !readDigits(text, 17, 2, second)) {
        return false;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 59) {
        return false;
    }

    size_t pos = 19;
    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > 9) {
            return false;
        }
        for (size_t i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    std::string suffix = text.substr(pos);
    if (!suffix.empty() && suffix != "Z" && suffix != "+00:00") {
        return false;
    }

    std::tm tm_buf = {};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;

    std::time_t seconds = timegm(&tm_buf);
    if (seconds == static_cast<std::time_t>(-1) && year != 1969) {
        return false;
    }
    // timegm rolls impossible dates such as Feb 31 into the next month
    if (tm_buf.tm_year != year - 1900 || tm_buf.tm_mon != month - 1 || tm_buf.tm_mday != day) {
        return false;
    }

    when = Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(seconds) + std::chrono::microseconds(micros)));
    return true;
}
