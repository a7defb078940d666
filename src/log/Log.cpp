#include "minerscan/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace minerscan::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
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
std::atomic<int> currentLevel{static_cast<int>(Level::Info)};

LogHandler currentInfoHandler() {
    std::lock_guard lock(sinkMutex);
    return infoHandler;
}

LogHandler currentErrorHandler() {
    std::lock_guard lock(sinkMutex);
    return errorHandler;
}

void dispatch(const LogHandler& handler, std::string_view message) {
    if (handler) {
        handler(message);
    }
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

void setLogLevel(Level level) {
    currentLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level logLevel() {
    return static_cast<Level>(currentLevel.load(std::memory_order_relaxed));
}

bool isEnabled(Level level) {
    return static_cast<int>(level) >= currentLevel.load(std::memory_order_relaxed);
}

void logDebug(std::string_view message) {
    if (!isEnabled(Level::Debug)) return;
    dispatch(currentInfoHandler(), message);
}

void logInfo(std::string_view message) {
    if (!isEnabled(Level::Info)) return;
    dispatch(currentInfoHandler(), message);
}

void logWarning(std::string_view message) {
    if (!isEnabled(Level::Warning)) return;
    dispatch(currentErrorHandler(), message);
}

// Errors are never filtered by level.
void logError(std::string_view message) {
    dispatch(currentErrorHandler(), message);
}

} // namespace minerscan::log
