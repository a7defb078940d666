#pragma once
#include "minerscan/core/Expected.hpp"
#include "minerscan/device/DeviceSnapshot.hpp"

namespace minerscan::poll {

/**
 * @brief Sink for every successful poll of one device.
 *
 * Called from the poller thread. A failed write is logged by the poller and
 * does not count as a poll failure.
 */
class Recorder {
public:
    virtual ~Recorder() = default;

    virtual expected<void> record(const device::DeviceRecord& snapshot) = 0;
};

} // namespace minerscan::poll
