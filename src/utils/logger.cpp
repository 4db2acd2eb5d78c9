// logger.cpp - Palm Signature Logging
// Copyright (c) 2025 Biometric Security Systems

#include "logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace {

// "%Y-%m-%d %H:%M:%S.mmm" in local time, or ISO-8601 with Z in UTC
std::string timeText(const std::chrono::system_clock::time_point& time, bool utc) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    long millis = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000);
    if (millis < 0) millis += 1000;

    std::tm parts;
    if (utc) {
        gmtime_r(&seconds, &parts);
    } else {
        localtime_r(&seconds, &parts);
    }

    char date[32];
    std::strftime(date, sizeof(date), utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S", &parts);

    char result[48];
    std::snprintf(result, sizeof(result), utc ? "%s.%03ldZ" : "%s.%03ld", date, millis);
    return result;
}

std::string threadText(const std::thread::id& id) {
    std::ostringstream oss;
    oss << id;
    return oss.str();
}

} // namespace

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
    std::string name = text;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (name == "WARN") {
        name = "WARNING";
    }

    for (LogLevel candidate : {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO,
                               LogLevel::WARNING, LogLevel::ERROR, LogLevel::CRITICAL,
                               LogLevel::FATAL}) {
        if (logLevelToString(candidate) == name) {
            level = candidate;
            return true;
        }
    }
    return false;
}

// ============================================================================
// FORMATTERS
// ============================================================================

TextFormatter::TextFormatter()
    : layout_()
{}

TextFormatter::TextFormatter(const Layout& layout)
    : layout_(layout)
{}

const char* TextFormatter::colorFor(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[37m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO: return "\033[32m";
        case LogLevel::WARNING: return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::CRITICAL: return "\033[35m";
        case LogLevel::FATAL: return "\033[1;31m";
        default: return "";
    }
}

std::string TextFormatter::format(const LogRecord& record) const {
    std::string text;

    if (layout_.timestamp) {
        text += "[" + timeText(record.time, false) + "] ";
    }

    if (layout_.level) {
        std::string name = logLevelToString(record.level);
        name.resize(8, ' ');
        if (layout_.color) {
            text += std::string(colorFor(record.level)) + "[" + name + "]\033[0m ";
        } else {
            text += "[" + name + "] ";
        }
    }

    if (layout_.thread) {
        text += "[Thread " + threadText(record.thread) + "] ";
    }

    if (!record.category.empty()) {
        text += "[" + record.category + "] ";
    }

    text += record.message;

    if (layout_.location && record.file) {
        text += " (" + std::string(record.file) + ":" + std::to_string(record.line);
        if (record.function) {
            text += " in " + std::string(record.function);
        }
        text += ")";
    }

    if (!record.fields.empty()) {
        std::vector<std::string> pairs;
        for (const auto& field : record.fields) {
            pairs.push_back(field.first + "=" + field.second);
        }
        std::sort(pairs.begin(), pairs.end());

        text += " {";
        for (size_t i = 0; i < pairs.size(); ++i) {
            text += (i > 0 ? ", " : "") + pairs[i];
        }
        text += "}";
    }

    return text;
}

std::string JsonLineFormatter::format(const LogRecord& record) const {
    nlohmann::json line;
    line["timestamp"] = timeText(record.time, true);
    line["level"] = logLevelToString(record.level);
    if (!record.category.empty()) {
        line["category"] = record.category;
    }
    line["message"] = record.message;
    line["thread"] = threadText(record.thread);
    if (record.file) {
        line["source"] = std::string(record.file) + ":" + std::to_string(record.line);
    }
    if (!record.fields.empty()) {
        line["fields"] = record.fields;
    }

    // Invalid UTF-8 in a message must not turn a log call into an exception
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// SINKS
// ============================================================================

void LogSink::consume(const LogRecord& record) {
    if (!isEnabled() || record.level < min_level_.load()) {
        return;
    }
    emit(record);
}

StreamSink::StreamSink(std::shared_ptr<ILogFormatter> formatter, std::ostream* stream)
    : formatter_(std::move(formatter))
    , stream_(stream ? stream : &std::cerr)
{}

void StreamSink::emit(const LogRecord& record) {
    std::string text = formatter_->format(record);
    std::lock_guard<std::mutex> lock(stream_mutex_);
    *stream_ << text << '\n';
}

void StreamSink::flush() {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    stream_->flush();
}

RotatingFileSink::RotatingFileSink(const std::string& path,
                                   std::shared_ptr<ILogFormatter> formatter,
                                   size_t max_bytes,
                                   int max_files,
                                   bool append)
    : path_(path)
    , formatter_(std::move(formatter))
    , max_bytes_(max_bytes)
    , max_files_(std::max(1, max_files))
    , written_(0)
{
    out_.open(path_, append ? (std::ios::out | std::ios::app) : std::ios::out);
    if (out_.is_open() && append) {
        out_.seekp(0, std::ios::end);
        std::streamoff size = out_.tellp();
        written_ = size > 0 ? static_cast<size_t>(size) : 0;
    }
}

bool RotatingFileSink::isEnabled() const {
    std::lock_guard<std::mutex> lock(file_mutex_);
    return LogSink::isEnabled() && out_.is_open();
}

void RotatingFileSink::emit(const LogRecord& record) {
    std::string text = formatter_->format(record);

    std::lock_guard<std::mutex> lock(file_mutex_);
    if (!out_.is_open()) {
        return;
    }
    out_ << text << '\n';
    written_ += text.size() + 1;

    if (max_bytes_ > 0 && written_ >= max_bytes_) {
        rotate();
    }
}

void RotatingFileSink::flush() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (out_.is_open()) {
        out_.flush();
    }
}

std::string RotatingFileSink::backupName(int index) const {
    return path_ + "." + std::to_string(index);
}

void RotatingFileSink::rotate() {
    out_.close();

    // path.(N-2) -> path.(N-1), ..., path -> path.1
    if (max_files_ > 1) {
        for (int i = max_files_ - 2; i >= 1; --i) {
            std::rename(backupName(i).c_str(), backupName(i + 1).c_str());
        }
        std::rename(path_.c_str(), backupName(1).c_str());
    }

    out_.open(path_, std::ios::out | std::ios::trunc);
    written_ = 0;
}

CallbackSink::CallbackSink(Callback callback)
    : callback_(std::move(callback))
{}

void CallbackSink::emit(const LogRecord& record) {
    if (callback_) {
        callback_(record);
    }
}

// ============================================================================
// LOGGER
// ============================================================================

Logger::Logger()
    : level_(LogLevel::INFO)
{}

Logger::~Logger() {
    flush();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

bool Logger::configure(const LoggerOptions& options) {
    std::vector<std::shared_ptr<LogSink>> sinks;

    if (options.console) {
        std::shared_ptr<ILogFormatter> formatter;
        if (options.json) {
            formatter = std::make_shared<JsonLineFormatter>();
        } else {
            TextFormatter::Layout layout;
            layout.color = options.color;
            formatter = std::make_shared<TextFormatter>(layout);
        }
        sinks.push_back(std::make_shared<StreamSink>(formatter));
    }

    bool file_opened = true;
    if (!options.file_path.empty()) {
        std::shared_ptr<ILogFormatter> formatter;
        if (options.json) {
            formatter = std::make_shared<JsonLineFormatter>();
        } else {
            TextFormatter::Layout layout;
            layout.thread = true;
            layout.location = true;
            formatter = std::make_shared<TextFormatter>(layout);
        }

        auto file_sink = std::make_shared<RotatingFileSink>(
            options.file_path, formatter, options.max_file_size, options.max_files);
        if (file_sink->isEnabled()) {
            sinks.push_back(file_sink);
        } else {
            file_opened = false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.swap(sinks);
    }
    level_ = options.level;

    if (!file_opened) {
        error("Failed to open log file: " + options.file_path);
    }
    return file_opened;
}

void Logger::addSink(std::shared_ptr<LogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clearSinks() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
}

size_t Logger::sinkCount() const {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    return sinks_.size();
}

void Logger::write(LogLevel level, const std::string& category, const std::string& message,
                   const char* file, int line, const char* function) {
    if (level < level_.load()) {
        return;
    }

    LogRecord record;
    record.level = level;
    record.category = category;
    record.message = message;
    record.file = file;
    record.line = line;
    record.function = function;
    write(std::move(record));
}

void Logger::write(LogRecord record) {
    if (record.level < level_.load()) {
        return;
    }
    record.time = std::chrono::system_clock::now();
    record.thread = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink : sinks_) {
        sink->consume(record);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

void Logger::trace(const std::string& message, const std::string& category) {
    getInstance().write(LogLevel::TRACE, category, message);
}

void Logger::debug(const std::string& message, const std::string& category) {
    getInstance().write(LogLevel::DEBUG, category, message);
}

void Logger::info(const std::string& message, const std::string& category) {
    getInstance().write(LogLevel::INFO, category, message);
}

void Logger::warning(const std::string& message, const std::string& category) {
    getInstance().write(LogLevel::WARNING, category, message);
}

void Logger::error(const std::string& message, const std::string& category) {
    getInstance().write(LogLevel::ERROR, category, message);
}

void Logger::critical(const std::string& message, const std::string& category) {
    getInstance().write(LogLevel::CRITICAL, category, message);
}

// ============================================================================
// PERFORMANCE LOGGER
// ============================================================================

PerformanceLogger::PerformanceLogger(const std::string& operation)
    : operation_(operation)
    , started_(std::chrono::steady_clock::now())
{}

PerformanceLogger::~PerformanceLogger() {
    if (Logger::getInstance().level() > LogLevel::DEBUG) {
        return;
    }

    auto elapsedMs = [this](std::chrono::steady_clock::time_point until) {
        return std::chrono::duration<double, std::milli>(until - started_).count();
    };

    std::ostringstream oss;
    oss << operation_ << " took " << elapsedMs(std::chrono::steady_clock::now()) << "ms";

    for (size_t i = 0; i < marks_.size(); ++i) {
        oss << (i == 0 ? " [" : ", ") << marks_[i].first << ": "
            << elapsedMs(marks_[i].second) << "ms";
    }
    if (!marks_.empty()) oss << "]";

    for (size_t i = 0; i < metrics_.size(); ++i) {
        oss << (i == 0 ? " {" : ", ") << metrics_[i].first << ": " << metrics_[i].second;
    }
    if (!metrics_.empty()) oss << "}";

    Logger::getInstance().write(LogLevel::DEBUG, "perf", oss.str());
}

void PerformanceLogger::checkpoint(const std::string& name) {
    marks_.emplace_back(name, std::chrono::steady_clock::now());
}

void PerformanceLogger::addMetric(const std::string& name, double value) {
    metrics_.emplace_back(name, value);
}
