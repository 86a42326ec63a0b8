#pragma once

#include <string>
#include <fstream>
#include <functional>
#include <mutex>
#include <atomic>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERR = 4,     // ERROR collides with a Windows macro
    NONE = 5
};

// Where console output goes. stdout is reserved for JSON in the command line tool.
enum class ConsoleStream {
    STDOUT,
    STDERR
};

/**
 * Process-wide logger shared by the walker workers, the fetchers and the HTTP
 * front end. Lines look like
 *   [2024-05-01 12:00:00.123] [INFO] [t3] message
 * where tN is a small per-thread number assigned on first use.
 */
class Logger {
public:
    // Receives every emitted line in addition to console and file output
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance();

    void init(LogLevel level = LogLevel::INFO,
              bool enableConsoleLogging = true,
              const std::string& logFilePath = "",
              ConsoleStream stream = ConsoleStream::STDERR);

    void setLogLevel(LogLevel level) { logLevel.store(level); }
    LogLevel getLogLevel() const { return logLevel.load(); }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::NONE && level >= logLevel.load();
    }

    void log(LogLevel level, const std::string& message);

    // Pass an empty function to remove the sink
    void setSink(Sink newSink);

    void close();

    ~Logger();

    // Parse "trace", "debug", "info", "warning"/"warn", "error", "none" (any case).
    // Unknown names yield the fallback.
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

    static const char* levelName(LogLevel level);

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string timestamp();
    static unsigned threadTag();

    std::atomic<LogLevel> logLevel;
    bool logToConsole;
    ConsoleStream consoleStream;
    std::ofstream logFile;
    Sink sink;
    std::mutex mutex;
};

// The message expression is only evaluated when the level is enabled
#define DOCS_FETCH_LOG(level, message) \
    do { \
        if (Logger::getInstance().isEnabled(level)) { \
            Logger::getInstance().log(level, message); \
        } \
    } while (0)

#define LOG_TRACE(message) DOCS_FETCH_LOG(LogLevel::TRACE, message)
#define LOG_DEBUG(message) DOCS_FETCH_LOG(LogLevel::DEBUG, message)
#define LOG_INFO(message) DOCS_FETCH_LOG(LogLevel::INFO, message)
#define LOG_WARNING(message) DOCS_FETCH_LOG(LogLevel::WARNING, message)
#define LOG_ERROR(message) DOCS_FETCH_LOG(LogLevel::ERR, message)
