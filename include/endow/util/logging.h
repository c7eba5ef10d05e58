// ENDOW - Logging System
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Leveled, categorized logging shared by every vault component:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - One category per component (token, tax, treasury, ...)
// - Console, rotating file and callback sinks
// - Stream-style and printf-style interfaces

#ifndef ENDOW_UTIL_LOGGING_H
#define ENDOW_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace endow {
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

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* TOKEN = "token";
    constexpr const char* TAX = "tax";
    constexpr const char* TREASURY = "treasury";
    constexpr const char* DONATION = "donation";
    constexpr const char* GUARD = "guard";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* VENUE = "venue";
    constexpr const char* KEEPER = "keeper";
    constexpr const char* DB = "db";
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
};

/// Which fields a sink renders in front of the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showLocation{false};
};

/// Render an entry as a single line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sink Interface
// ============================================================================

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

// ============================================================================
// Console Sink
// ============================================================================

/// Writes to stdout; errors optionally go to stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
        LogFormat format;
    };
    
    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}
    
    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;
    
    static const char* ColorCode(LogLevel level);
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a file, rotating to path.1 ... path.N once maxSize is reached
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogFormat format{true, true, true, true};
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
    
    void OpenLocked(bool append);
    void Rotate();
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Forwards entries to a function; used by tests to capture output
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;
    
    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}
    
    void Write(const LogEntry& entry) override {
        if (Accepts(entry) && callback_) {
            callback_(entry);
        }
    }
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
    
    /// Install a default console sink if no sinks are configured
    void Initialize();
    
    /// Flush and drop all sinks
    void Shutdown();
    
    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;
    
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    
    /// Restrict output to the enabled categories (all are enabled by default)
    void EnableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;
    
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);
    
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
    std::atomic<bool> allCategoriesEnabled_{true};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
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

#define ENDOW_LOGGER ::endow::util::Logger::Instance()

#define ENDOW_LOG_ENABLED(level, category) \
    ENDOW_LOGGER.WillLog(::endow::util::LogLevel::level, category)

#define ENDOW_LOG(level, category) \
    if (ENDOW_LOG_ENABLED(level, category)) \
        ::endow::util::LogStream(::endow::util::LogLevel::level, category, \
                                 __FILE__, __LINE__)

#define LOG_TRACE(category)   ENDOW_LOG(Trace, category)
#define LOG_DEBUG(category)   ENDOW_LOG(Debug, category)
#define LOG_INFO(category)    ENDOW_LOG(Info, category)
#define LOG_WARN(category)    ENDOW_LOG(Warn, category)
#define LOG_ERROR(category)   ENDOW_LOG(Error, category)
#define LOG_FATAL(category)   ENDOW_LOG(Fatal, category)

#define ENDOW_LOGF(level, category, ...) \
    do { \
        if (ENDOW_LOG_ENABLED(level, category)) { \
            ENDOW_LOGGER.LogF(::endow::util::LogLevel::level, category, \
                              __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  ENDOW_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   ENDOW_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   ENDOW_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  ENDOW_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs the wall time of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Basename of a source path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace endow

#endif // ENDOW_UTIL_LOGGING_H
