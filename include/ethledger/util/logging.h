// ETHLEDGER - Logging System
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// Leveled, categorized, thread-safe logging with pluggable sinks and
// stream-style or printf-style front ends. Key material never goes here.

#ifndef ETHLEDGER_UTIL_LOGGING_H
#define ETHLEDGER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace ethledger {
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
    Off = 5
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive); unknown strings give Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* DEVICE = "device";
    constexpr const char* SIGNER = "signer";
    constexpr const char* WALLET = "wallet";
    constexpr const char* RPC = "rpc";
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

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes formatted lines to stderr so stdout stays free for command output
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool showTimestamp{true};
        bool showCategory{true};
        bool showThread{false};
        bool showLocation{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    /// Format entry for output
    std::string Format(const LogEntry& entry) const;

private:
    Config config_;
    std::mutex mutex_;

    const char* GetColorCode(LogLevel level) const;
};

/// Forwards entries to a callback (tests, host applications)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    /// Get the singleton instance
    static Logger& Instance();

    /// Install the default console sink (once)
    void Initialize(LogLevel level = LogLevel::Info);

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to explicitly enabled categories
    void EnableCategory(const std::string& category);

    /**
     * Apply a comma-separated category list such as "device,signer".
     * Empty, "1", "all" and "*" enable every category.
     */
    void SetCategoryFilter(const std::string& list);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    /// Log with printf-style formatting
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    bool allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects one message and hands it to the logger on destruction
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

#define ETHLEDGER_LOGGER ::ethledger::util::Logger::Instance()

#define ETHLEDGER_LOG_ENABLED(level, category) \
    ETHLEDGER_LOGGER.WillLog(::ethledger::util::LogLevel::level, category)

#define ETHLEDGER_LOG(level, category) \
    if (!ETHLEDGER_LOG_ENABLED(level, category)) {} else \
        ::ethledger::util::LogStream(::ethledger::util::LogLevel::level, category, \
                                     __FILE__, __LINE__)

#define LOG_TRACE(category)   ETHLEDGER_LOG(Trace, category)
#define LOG_DEBUG(category)   ETHLEDGER_LOG(Debug, category)
#define LOG_INFO(category)    ETHLEDGER_LOG(Info, category)
#define LOG_WARN(category)    ETHLEDGER_LOG(Warn, category)
#define LOG_ERROR(category)   ETHLEDGER_LOG(Error, category)

#define ETHLEDGER_LOGF(level, category, ...) \
    do { \
        if (ETHLEDGER_LOG_ENABLED(level, category)) { \
            ETHLEDGER_LOGGER.LogF(::ethledger::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  ETHLEDGER_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   ETHLEDGER_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   ETHLEDGER_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  ETHLEDGER_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

/// "0x1234ab...cdef01" form of a long hex string for log lines
std::string AbbreviateHex(const std::string& hex, size_t keep = 6);

} // namespace util
} // namespace ethledger

#endif // ETHLEDGER_UTIL_LOGGING_H
