#include "bulbs/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace bulbs::log {

namespace {

// Diagnostics go to stderr so stdout carries only command output.
LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::clog << message;
        std::clog.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();
std::atomic<bool> verbose{false};

LogHandler currentInfoHandler() {
    std::lock_guard lock(sinkMutex);
    return infoHandler;
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    infoHandler = handler ? std::move(handler) : makeDefaultInfoSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    errorHandler = makeDefaultErrorSink();
}

void setVerboseLogging(bool enabled) {
    verbose.store(enabled, std::memory_order_relaxed);
}

bool verboseLogging() {
    return verbose.load(std::memory_order_relaxed);
}

void logDebug(std::string_view message) {
    if (!verboseLogging()) {
        return;
    }
    if (auto handler = currentInfoHandler()) {
        handler(message);
    }
}

void logInfo(std::string_view message) {
    if (auto handler = currentInfoHandler()) {
        handler(message);
    }
}

void logError(std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = errorHandler;
    }
    if (handler) {
        handler(message);
    }
}

} // namespace bulbs::log
