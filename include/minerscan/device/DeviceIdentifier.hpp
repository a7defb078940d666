#pragma once
#include "minerscan/core/Expected.hpp"
#include "minerscan/core/Errors.hpp"
#include "minerscan/device/DeviceSnapshot.hpp"
#include "minerscan/net/NetConfig.hpp"

#include <atomic>
#include <chrono>

namespace minerscan::device {

using minerscan::expected;

enum class Command {
    Start,
    Stop,
    ToggleFaultLight,
};

const char* toString(Command command);

/**
 * @brief Device-communication seam consumed by the scanner and pollers.
 *
 * `identify` performs exactly one attempt; retry policy belongs to the caller
 * (see identifyWithRetries). Failures are IdentifyError / CommandError codes.
 * Implementations must be safe to call from many threads at once.
 */
class DeviceIdentifier {
public:
    virtual ~DeviceIdentifier() = default;

    virtual expected<DeviceSnapshot>
    identify(const net::address_v4& address, std::chrono::milliseconds timeout) = 0;

    /// State-changing; never retried by the core.
    virtual expected<void>
    sendCommand(const net::address_v4& address, Command command) = 0;

    /// Opens http://<address>/ in the desktop browser. Fire-and-forget.
    virtual void openWebInterface(const net::address_v4& address);
};

/// Upper bound for `retries`; larger values are clamped.
constexpr unsigned kMaxConnectivityRetries = 10;

inline unsigned clampRetries(unsigned retries) {
    return retries > kMaxConnectivityRetries ? kMaxConnectivityRetries : retries;
}

/**
 * @brief Run `identify` up to `1 + retries` times.
 *
 * `retries` counts additional attempts after the first and is clamped to
 * kMaxConnectivityRetries. Only transient errors
 * (timeout, refused, reset) are retried; a protocol mismatch is returned at
 * once. When @p cancelled becomes true no further attempt is started and the
 * last error (or `operation_canceled` before any attempt) is returned.
 */
expected<DeviceSnapshot>
identifyWithRetries(DeviceIdentifier& identifier,
                    const net::address_v4& address,
                    std::chrono::milliseconds timeout,
                    unsigned retries,
                    const std::atomic<bool>* cancelled = nullptr);

} // namespace minerscan::device
