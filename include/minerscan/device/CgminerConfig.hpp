#pragma once

#include <chrono>
#include <cstddef>

namespace minerscan::device::config {

/**
 * @brief Constants for the cgminer-style JSON API spoken by most ASIC firmwares.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short CGMINER_API_PORT = 4028;
constexpr std::size_t CGMINER_MAX_RESPONSE_BYTES = 1 << 20;

// Telemetry layout ------------------------------------------------------------
constexpr std::size_t CGMINER_MAX_BOARDS = 16;   // chain_rate1..N / temp2_1..N
constexpr std::size_t CGMINER_MAX_FANS = 8;      // fan1..N

} // namespace minerscan::device::config
