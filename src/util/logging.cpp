// ARBITER - Logging Implementation
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/util/logging.h>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace arbiter {
namespace util {

// ============================================================================
// Log Level Functions
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
        default:              return "UNKNOWN";
    }
}

bool TryParseLogLevel(const std::string& str, LogLevel& out) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "TRACE") { out = LogLevel::Trace; return true; }
    if (upper == "DEBUG") { out = LogLevel::Debug; return true; }
    if (upper == "INFO")  { out = LogLevel::Info; return true; }
    if (upper == "WARN" || upper == "WARNING") { out = LogLevel::Warn; return true; }
    if (upper == "ERROR") { out = LogLevel::Error; return true; }
    if (upper == "FATAL") { out = LogLevel::Fatal; return true; }
    if (upper == "OFF")   { out = LogLevel::Off; return true; }
    return false;
}

LogLevel LogLevelFromString(const std::string& str) {
    LogLevel level = LogLevel::Info;
    TryParseLogLevel(str, level);
    return level;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tmBuf;
    localtime_r(&time, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos != std::string::npos) {
        return path.substr(pos + 1);
    }
    return path;
}

namespace {

std::string FormatEntry(const LogEntry& entry, bool timestamp, bool category,
                        bool thread, bool location) {
    std::ostringstream oss;
    if (timestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << " ";
    }
    std::string level = LogLevelToString(entry.level);
    level.resize(5, ' ');
    oss << "[" << level << "] ";
    if (category && !entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        oss << "[" << entry.category << "] ";
    }
    if (thread) {
        oss << "[" << entry.threadId << "] ";
    }
    if (location && !entry.file.empty()) {
        oss << GetBasename(entry.file) << ":" << entry.line << " ";
    }
    oss << entry.message;
    return oss.str();
}

} // namespace

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() = default;

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (!Accepts(entry)) {
        return;
    }

    std::string formatted = Format(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* stream = (config_.useStderr && entry.level >= LogLevel::Error) ? stderr : stdout;
    if (config_.useColors && isatty(fileno(stream))) {
        fprintf(stream, "%s%s\033[0m\n", ColorCode(entry.level), formatted.c_str());
    } else {
        fprintf(stream, "%s\n", formatted.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stdout);
    fflush(stderr);
}

std::string ConsoleSink::Format(const LogEntry& entry) const {
    return FormatEntry(entry, config_.showTimestamp, config_.showCategory,
                       config_.showThread, false);
}

const char* ConsoleSink::ColorCode(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35;1m";
        default:              return "\033[0m";
    }
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config) : config_(config) {
    std::lock_guard<std::mutex> lock(mutex_);
    OpenLocked();
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

bool FileSink::OpenLocked() {
    if (config_.path.empty()) {
        return false;
    }
    auto mode = config_.append ? (std::ios::out | std::ios::app) : std::ios::out;
    file_.open(config_.path, mode);
    if (!file_.is_open()) {
        return false;
    }
    file_.seekp(0, std::ios::end);
    currentSize_ = static_cast<size_t>(file_.tellp());
    return true;
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    if (!Accepts(entry)) {
        return;
    }

    std::string formatted = FormatEntry(entry, true, true, true, true) + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    if (config_.maxSize > 0 && currentSize_ >= config_.maxSize) {
        Rotate();
        if (!file_.is_open()) {
            return;
        }
    }

    file_ << formatted;
    currentSize_ += formatted.size();
    if (config_.autoFlush) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::Rotate() {
    file_.close();

    // Shift path.N-1 -> path.N, dropping the oldest
    std::string oldest = config_.path + "." + std::to_string(config_.maxFiles);
    std::remove(oldest.c_str());
    for (size_t i = config_.maxFiles; i > 1; --i) {
        std::string from = config_.path + "." + std::to_string(i - 1);
        std::string to = config_.path + "." + std::to_string(i);
        std::rename(from.c_str(), to.c_str());
    }
    std::string rotated = config_.path + ".1";
    std::rename(config_.path.c_str(), rotated.c_str());

    file_.open(config_.path, std::ios::out | std::ios::trunc);
    currentSize_ = 0;
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)) {
    SetLevel(level);
}

void CallbackSink::Write(const LogEntry& entry) {
    if (!Accepts(entry) || !callback_) {
        return;
    }
    callback_(entry);
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    disabledCategories_.insert(category);
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    disabledCategories_.erase(category);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return disabledCategories_.find(category) == disabledCategories_.end();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message, const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    // Copy so a sink callback may add or remove sinks
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(LogLevel level, const char* category, const char* file, int line)
    : level_(level), category_(category), file_(file), line_(line) {}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

// ============================================================================
// Initialization
// ============================================================================

bool InitLogging(LogLevel level, bool console, const std::string& logFile) {
    Logger& logger = Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(level);

    if (console) {
        logger.AddSink(std::make_shared<ConsoleSink>());
    }
    if (!logFile.empty()) {
        FileSink::Config config;
        config.path = logFile;
        auto sink = std::make_shared<FileSink>(config);
        if (!sink->IsOpen()) {
            return false;
        }
        logger.AddSink(sink);
    }
    return true;
}

} // namespace util
} // namespace arbiter
