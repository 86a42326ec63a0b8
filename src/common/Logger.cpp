#include "../../include/Logger.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <cctype>

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : logLevel(LogLevel::INFO)
    , logToConsole(true)
    , consoleStream(ConsoleStream::STDERR) {
}

Logger::~Logger() {
    close();
}

void Logger::init(LogLevel level, bool enableConsoleLogging, const std::string& logFilePath, ConsoleStream stream) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel.store(level);
    logToConsole = enableConsoleLogging;
    consoleStream = stream;

    if (logFile.is_open()) {
        logFile.close();
    }
    if (logFilePath.empty()) {
        return;
    }
    logFile.open(logFilePath, std::ios::out | std::ios::app);
    if (!logFile.is_open()) {
        std::cerr << "[WARN] Could not open log file: " << logFilePath << std::endl;
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::ostringstream line;
    line << '[' << timestamp() << "] [" << levelName(level) << "] [t" << threadTag() << "] " << message;
    const std::string output = line.str();

    std::lock_guard<std::mutex> lock(mutex);
    if (logToConsole) {
        std::ostream& out = consoleStream == ConsoleStream::STDOUT ? std::cout : std::cerr;
        out << output << '\n';
        out.flush();
    }
    if (logFile.is_open()) {
        logFile << output << '\n';
        logFile.flush();
    }
    if (sink) {
        sink(level, output);
    }
}

void Logger::setSink(Sink newSink) {
    std::lock_guard<std::mutex> lock(mutex);
    sink = std::move(newSink);
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex);
    if (logFile.is_open()) {
        logFile.close();
    }
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error" || lower == "err") return LogLevel::ERR;
    if (lower == "none" || lower == "off") return LogLevel::NONE;
    return fallback;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERR: return "ERROR";
        case LogLevel::NONE: break;
    }
    return "NONE";
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

unsigned Logger::threadTag() {
    static std::atomic<unsigned> nextTag{1};
    thread_local unsigned tag = nextTag.fetch_add(1);
    return tag;
}
