#include <catch2/catch_test_macros.hpp>
#include "Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

TEST_CASE("Logger parses level names", "[Logger]") {
    REQUIRE(Logger::parseLevel("debug") == LogLevel::DEBUG);
    REQUIRE(Logger::parseLevel("WARN") == LogLevel::WARNING);
    REQUIRE(Logger::parseLevel("Warning") == LogLevel::WARNING);
    REQUIRE(Logger::parseLevel("error") == LogLevel::ERR);
    REQUIRE(Logger::parseLevel("none") == LogLevel::NONE);
    REQUIRE(Logger::parseLevel("verbose") == LogLevel::INFO);
    REQUIRE(Logger::parseLevel("verbose", LogLevel::TRACE) == LogLevel::TRACE);
}

TEST_CASE("Logger filters by level", "[Logger]") {
    Logger& logger = Logger::getInstance();
    LogLevel previous = logger.getLogLevel();

    logger.setLogLevel(LogLevel::WARNING);
    REQUIRE_FALSE(logger.isEnabled(LogLevel::INFO));
    REQUIRE(logger.isEnabled(LogLevel::WARNING));
    REQUIRE(logger.isEnabled(LogLevel::ERR));

    logger.setLogLevel(LogLevel::NONE);
    REQUIRE_FALSE(logger.isEnabled(LogLevel::ERR));

    logger.setLogLevel(previous);
}

TEST_CASE("Logger writes enabled messages to the log file", "[Logger]") {
    const std::string path = (std::filesystem::temp_directory_path() / "docs_fetch_logger_test.log").string();
    std::filesystem::remove(path);

    Logger& logger = Logger::getInstance();
    LogLevel previous = logger.getLogLevel();
    logger.init(LogLevel::INFO, false, path);

    LOG_DEBUG("hidden debug line");
    LOG_WARNING("visible warning line");
    logger.close();

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    REQUIRE(contents.str().find("visible warning line") != std::string::npos);
    REQUIRE(contents.str().find("[WARN]") != std::string::npos);
    REQUIRE(contents.str().find("hidden debug line") == std::string::npos);

    logger.init(previous, true, "");
    std::filesystem::remove(path);
}

TEST_CASE("Logger forwards lines to the sink with a thread tag", "[Logger]") {
    Logger& logger = Logger::getInstance();
    LogLevel previous = logger.getLogLevel();
    logger.init(LogLevel::DEBUG, false, "");

    std::vector<std::pair<LogLevel, std::string>> captured;
    logger.setSink([&captured](LogLevel level, const std::string& line) {
        captured.emplace_back(level, line);
    });

    int evaluated = 0;
    auto expensive = [&evaluated]() {
        ++evaluated;
        return std::string("trace detail");
    };
    LOG_TRACE(expensive());
    LOG_DEBUG("walker started");
    logger.setSink(nullptr);

    REQUIRE(evaluated == 0);
    REQUIRE(captured.size() == 1);
    REQUIRE(captured[0].first == LogLevel::DEBUG);
    REQUIRE(captured[0].second.find("[DEBUG] [t") != std::string::npos);
    REQUIRE(captured[0].second.find("walker started") != std::string::npos);

    logger.init(previous, true, "");
}
