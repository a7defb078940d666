#pragma once
#include "minerscan/log/Log.hpp"

#include <chrono>
#include <functional>
#include <thread>
#include <type_traits>

// Shared assertion macros for the standalone test executables. Failures are
// counted, reported through the error log sink and turned into the exit code
// by finishTests().

static int g_failures = 0;

namespace minerscan::testing {

template <typename T>
auto show(const T& value) {
    if constexpr (std::is_enum_v<T>) {
        return static_cast<std::underlying_type_t<T>>(value);
    } else if constexpr (std::is_same_v<T, char> || std::is_same_v<T, unsigned char> ||
                         std::is_same_v<T, signed char>) {
        return static_cast<int>(value);
    } else {
        return value;
    }
}

/// Polls @p condition until it holds or @p timeout elapses.
inline bool waitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

inline void silenceInfoLogs() {
    minerscan::setInfoLogHandler([](std::string_view) {});
}

inline int finishTests(const char* suite) {
    if (g_failures) {
        minerscan::logError(suite, ": ", g_failures, " failure(s)\n");
        return 1;
    }
    minerscan::resetLogHandlers();
    minerscan::logInfo(suite, " tests passed.\n");
    return 0;
}

} // namespace minerscan::testing

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { minerscan::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { minerscan::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", minerscan::testing::show(_va), " != ", minerscan::testing::show(_vb), ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)
