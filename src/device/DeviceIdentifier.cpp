#include "minerscan/device/DeviceIdentifier.hpp"
#include "minerscan/log/Log.hpp"

#include <cstdlib>
#include <string>
#include <thread>

namespace minerscan::device {

const char* toString(Command command) {
    switch (command) {
        case Command::Start:            return "start";
        case Command::Stop:             return "stop";
        case Command::ToggleFaultLight: return "toggle-fault-light";
    }
    return "unknown";
}

void DeviceIdentifier::openWebInterface(const net::address_v4& address) {
    const std::string url = "http://" + address.to_string() + "/";
    std::thread([url] {
        const std::string cmd = "xdg-open " + url + " >/dev/null 2>&1";
        if (const int rc = std::system(cmd.c_str()); rc != 0) {
            logWarning("[DeviceIdentifier] could not open ", url, " (exit ", rc, ")\n");
        }
    }).detach();
}

expected<DeviceSnapshot>
identifyWithRetries(DeviceIdentifier& identifier,
                    const net::address_v4& address,
                    std::chrono::milliseconds timeout,
                    unsigned retries,
                    const std::atomic<bool>* cancelled) {
    std::error_code lastError = std::make_error_code(std::errc::operation_canceled);
    retries = clampRetries(retries);

    for (unsigned attempt = 0;; ++attempt) {
        if (cancelled && cancelled->load(std::memory_order_acquire)) {
            break;
        }

        auto result = identifier.identify(address, timeout);
        if (result) {
            if (attempt > 0) {
                logDebug("[DeviceIdentifier] ", address.to_string(), " succeeded on attempt ",
                         attempt + 1, "\n");
            }
            return result;
        }

        lastError = result.error();
        if (!isTransient(lastError)) {
            logDebug("[DeviceIdentifier] ", address.to_string(), ": ", lastError.message(),
                     " (not retried)\n");
            break;
        }
        logDebug("[DeviceIdentifier] ", address.to_string(), " attempt ", attempt + 1, "/",
                 retries + 1, " failed: ", lastError.message(), "\n");
        if (attempt == retries) {
            break;
        }
    }

    return unexpected(lastError);
}

} // namespace minerscan::device
