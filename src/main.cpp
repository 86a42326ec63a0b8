#include <uwebsockets/App.h>
#include "../include/routing/RouteRegistry.h"
#include "../include/Logger.h"
#include "crawler/CurlTransfer.h"

#include <cstdlib>
#include <csignal>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <unistd.h>
#include <execinfo.h>

namespace {

constexpr int kDefaultPort = 3000;

// Print a backtrace to stderr on fatal signals, then exit with 128 + signal
void installCrashHandler() {
    auto onFatalSignal = [](int sig) {
        void* frames[64];
        int count = backtrace(frames, 64);
        std::cerr << "[FATAL] Signal " << sig << ", backtrace of " << count << " frames:\n";
        backtrace_symbols_fd(frames, count, STDERR_FILENO);
        _exit(128 + sig);
    };
    std::signal(SIGSEGV, onFatalSignal);
    std::signal(SIGABRT, onFatalSignal);
}

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

// LOG_LEVEL, LOG_FILE
void configureLogging() {
    LogLevel level = LogLevel::INFO;
    if (auto name = env("LOG_LEVEL")) {
        level = Logger::parseLevel(*name);
    }
    Logger::getInstance().init(level, true, env("LOG_FILE").value_or(""));
}

// PORT, falling back to the default when missing or out of range
int listenPort() {
    auto raw = env("PORT");
    if (!raw) {
        return kDefaultPort;
    }
    try {
        int port = std::stoi(*raw);
        if (port > 0 && port <= 65535) {
            return port;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG(std::string("PORT parse error: ") + e.what());
    }
    LOG_WARNING("Ignoring invalid PORT='" + *raw + "', using " + std::to_string(kDefaultPort));
    return kDefaultPort;
}

} // namespace

int main() {
    installCrashHandler();
    configureLogging();
    docs_fetch::crawler::initCurlGlobal();

    routing::RouteRegistry& registry = routing::RouteRegistry::getInstance();
    registry.setTraceRequests(env("TRACE_REQUESTS").value_or("1") != "0");

    // Controllers register themselves from their own translation units
    for (const auto& route : registry.getRoutes()) {
        LOG_INFO("Route: " + route.describe());
    }

    const int port = listenPort();
    uWS::App app;
    registry.applyRoutes(app);

    bool listening = false;
    app.listen(port, [port, &listening](auto* listenSocket) {
        listening = listenSocket != nullptr;
        if (listening) {
            LOG_INFO("docs_fetch_server listening on port " + std::to_string(port));
        } else {
            LOG_ERROR("Failed to listen on port " + std::to_string(port));
        }
    }).run();

    LOG_INFO("Server stopped");
    Logger::getInstance().close();
    return listening ? 0 : 1;
}
