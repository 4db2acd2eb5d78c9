// logger.h - Palm Signature Logging
// Process-wide sink registry with pluggable formatters
// Copyright (c) 2025 Biometric Security Systems

#ifndef LOGGER_H
#define LOGGER_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5,
    FATAL = 6
};

std::string logLevelToString(LogLevel level);

// Case-insensitive; "warn" is accepted for WARNING. level is left untouched
// on failure.
bool parseLogLevel(const std::string& text, LogLevel& level);

struct LogRecord {
    std::chrono::system_clock::time_point time;
    LogLevel level = LogLevel::INFO;
    std::string category;
    std::string message;
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;
    std::thread::id thread;
    std::unordered_map<std::string, std::string> fields;
};

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogRecord& record) const = 0;
};

// "[2025-01-02 03:04:05.678] [WARNING ] [store] message (file:line)"
class TextFormatter : public ILogFormatter {
public:
    struct Layout {
        bool timestamp = true;
        bool level = true;
        bool thread = false;
        bool location = false;
        bool color = false;
    };

    TextFormatter();
    explicit TextFormatter(const Layout& layout);

    std::string format(const LogRecord& record) const override;

private:
    static const char* colorFor(LogLevel level);

    Layout layout_;
};

// One compact JSON object per record
class JsonLineFormatter : public ILogFormatter {
public:
    std::string format(const LogRecord& record) const override;
};

// Level filtering and enable switch shared by all sinks
class LogSink {
public:
    virtual ~LogSink() = default;

    void consume(const LogRecord& record);
    virtual void flush() {}

    void setMinLevel(LogLevel level) { min_level_ = level; }
    void setEnabled(bool enabled) { enabled_ = enabled; }
    virtual bool isEnabled() const { return enabled_.load(); }

protected:
    virtual void emit(const LogRecord& record) = 0;

private:
    std::atomic<bool> enabled_{true};
    std::atomic<LogLevel> min_level_{LogLevel::TRACE};
};

// Writes to std::cerr unless redirected; stdout carries command output
class StreamSink : public LogSink {
public:
    explicit StreamSink(std::shared_ptr<ILogFormatter> formatter,
                        std::ostream* stream = nullptr);

    void flush() override;

protected:
    void emit(const LogRecord& record) override;

private:
    std::shared_ptr<ILogFormatter> formatter_;
    std::ostream* stream_;
    std::mutex stream_mutex_;
};

// Appends to a file and shifts it to path.1 once it grows past max_bytes.
// max_files counts the active file, so backups run path.1 .. path.(N-1).
class RotatingFileSink : public LogSink {
public:
    RotatingFileSink(const std::string& path,
                     std::shared_ptr<ILogFormatter> formatter,
                     size_t max_bytes,
                     int max_files,
                     bool append = true);

    bool isEnabled() const override;
    void flush() override;

protected:
    void emit(const LogRecord& record) override;

private:
    void rotate();
    std::string backupName(int index) const;

    std::string path_;
    std::shared_ptr<ILogFormatter> formatter_;
    size_t max_bytes_;
    int max_files_;

    std::ofstream out_;
    size_t written_;
    mutable std::mutex file_mutex_;
};

class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback callback);

protected:
    void emit(const LogRecord& record) override;

private:
    Callback callback_;
};

struct LoggerOptions {
    LogLevel level = LogLevel::INFO;
    bool console = true;
    bool color = false;
    bool json = false;
    std::string file_path;
    size_t max_file_size = 10 * 1024 * 1024;
    int max_files = 5;
};

// Holds sinks only, never domain state
class Logger {
public:
    static Logger& getInstance();

    // Replaces every sink with those described by options. Returns false if
    // the log file could not be opened; console logging still works.
    bool configure(const LoggerOptions& options);

    void addSink(std::shared_ptr<LogSink> sink);
    void clearSinks();
    size_t sinkCount() const;

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_.load(); }

    void write(LogLevel level, const std::string& category, const std::string& message,
               const char* file = nullptr, int line = 0, const char* function = nullptr);
    void write(LogRecord record);

    void flush();

    static void trace(const std::string& message, const std::string& category = "");
    static void debug(const std::string& message, const std::string& category = "");
    static void info(const std::string& message, const std::string& category = "");
    static void warning(const std::string& message, const std::string& category = "");
    static void error(const std::string& message, const std::string& category = "");
    static void critical(const std::string& message, const std::string& category = "");

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
};

#define PALMSIG_LOG(level, cat, msg) \
    Logger::getInstance().write(level, cat, msg, __FILE__, __LINE__, __FUNCTION__)

#define LOG_DEBUG(msg) PALMSIG_LOG(LogLevel::DEBUG, "", msg)
#define LOG_INFO(msg) PALMSIG_LOG(LogLevel::INFO, "", msg)
#define LOG_WARNING(msg) PALMSIG_LOG(LogLevel::WARNING, "", msg)
#define LOG_ERROR(msg) PALMSIG_LOG(LogLevel::ERROR, "", msg)

#define LOG_DEBUG_CAT(cat, msg) PALMSIG_LOG(LogLevel::DEBUG, cat, msg)
#define LOG_INFO_CAT(cat, msg) PALMSIG_LOG(LogLevel::INFO, cat, msg)
#define LOG_WARNING_CAT(cat, msg) PALMSIG_LOG(LogLevel::WARNING, cat, msg)
#define LOG_ERROR_CAT(cat, msg) PALMSIG_LOG(LogLevel::ERROR, cat, msg)

// Logs the elapsed time of a scope at DEBUG, with optional checkpoints
class PerformanceLogger {
public:
    explicit PerformanceLogger(const std::string& operation);
    ~PerformanceLogger();

    void checkpoint(const std::string& name);
    void addMetric(const std::string& name, double value);

private:
    std::string operation_;
    std::chrono::steady_clock::time_point started_;
    std::vector<std::pair<std::string, std::chrono::steady_clock::time_point>> marks_;
    std::vector<std::pair<std::string, double>> metrics_;
};

#define PERF_LOG(name) PerformanceLogger perf_logger_scope_(name)

#endif // LOGGER_H
