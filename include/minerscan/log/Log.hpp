#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace minerscan::log {

/**
 * @brief Process-wide logging front end with replaceable sinks.
 *
 * Debug and info messages go to the info handler, warnings and errors to the
 * error handler. Defaults write to stdout / stderr. Messages below the current
 * level are dropped before the handler is looked up, so stream-building cost is
 * only paid for the variadic overloads.
 */
enum class Level {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void setLogLevel(Level level);
Level logLevel();
bool isEnabled(Level level);

void logDebug(std::string_view message);
void logInfo(std::string_view message);
void logWarning(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

template<typename First, typename... Rest>
using EnableVariadic = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !IsStringViewConvertible<std::decay_t<First>>::value>;

} // namespace detail

template<typename First, typename... Rest, typename = detail::EnableVariadic<First, Rest...>>
void logDebug(First&& first, Rest&&... rest) {
    if (!isEnabled(Level::Debug)) return;
    logDebug(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

template<typename First, typename... Rest, typename = detail::EnableVariadic<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    if (!isEnabled(Level::Info)) return;
    logInfo(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

template<typename First, typename... Rest, typename = detail::EnableVariadic<First, Rest...>>
void logWarning(First&& first, Rest&&... rest) {
    if (!isEnabled(Level::Warning)) return;
    logWarning(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

template<typename First, typename... Rest, typename = detail::EnableVariadic<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    logError(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

} // namespace minerscan::log

namespace minerscan {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logDebug;
using log::logInfo;
using log::logWarning;
using log::logError;
} // namespace minerscan
