// ARBITER - Logging System
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Process-wide logger with pluggable sinks. Protocol components log
// rejected operations at Debug, isolated external failures at Warn and
// solvency or store failures at Error.

#ifndef ARBITER_UTIL_LOGGING_H
#define ARBITER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace arbiter {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive, defaults to Info)
LogLevel LogLevelFromString(const std::string& str);

/// Strict parse; false if the string names no level
bool TryParseLogLevel(const std::string& str, LogLevel& out);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* RESOLUTION = "resolution";
    constexpr const char* STAKING = "staking";
    constexpr const char* EVIDENCE = "evidence";
    constexpr const char* VOTING = "voting";
    constexpr const char* DISPUTE = "dispute";
    constexpr const char* SETTLEMENT = "settlement";
    constexpr const char* EXTERNAL = "external";
    constexpr const char* STORE = "store";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Output destination. Entries below the sink's level are dropped.
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    bool Accepts(const LogEntry& entry) const { return entry.level >= level_.load(); }

private:
    std::atomic<LogLevel> level_{LogLevel::Trace};
};

/// Writes to stdout, errors optionally to stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        bool showTimestamp{true};
        bool showCategory{true};
        bool showThread{false};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
    static const char* ColorCode(LogLevel level);
};

/// Appends to a file with size-based rotation (path.1 ... path.N)
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;

    size_t GetCurrentSize() const { return currentSize_; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    bool OpenLocked();
    void Rotate();
};

/// Forwards entries to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;
    void Flush() override {}

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Silence a category regardless of level
    void DisableCategory(const std::string& category);
    void EnableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    /// Log with printf-style formatting
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> disabledCategories_;
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define ARBITER_LOGGER ::arbiter::util::Logger::Instance()

#define ARBITER_LOG_ENABLED(level, category) \
    ARBITER_LOGGER.WillLog(::arbiter::util::LogLevel::level, category)

#define ARBITER_LOG(level, category) \
    if (!ARBITER_LOG_ENABLED(level, category)) {} else \
        ::arbiter::util::LogStream(::arbiter::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   ARBITER_LOG(Trace, category)
#define LOG_DEBUG(category)   ARBITER_LOG(Debug, category)
#define LOG_INFO(category)    ARBITER_LOG(Info, category)
#define LOG_WARN(category)    ARBITER_LOG(Warn, category)
#define LOG_ERROR(category)   ARBITER_LOG(Error, category)

#define ARBITER_LOGF(level, category, ...) \
    do { \
        if (ARBITER_LOG_ENABLED(level, category)) { \
            ARBITER_LOGGER.LogF(::arbiter::util::LogLevel::level, category, \
                                __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  ARBITER_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   ARBITER_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   ARBITER_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  ARBITER_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp as "YYYY-MM-DD HH:MM:SS.mmm" (local time)
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

/**
 * Replace the logger's sinks with a console sink (when console is true)
 * and a file sink (when logFile is non-empty), then set the global level.
 *
 * @return false if the log file could not be opened
 */
bool InitLogging(LogLevel level, bool console, const std::string& logFile);

} // namespace util
} // namespace arbiter

#endif // ARBITER_UTIL_LOGGING_H
