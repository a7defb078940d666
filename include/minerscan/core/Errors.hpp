#pragma once

#include <string>
#include <system_error>

namespace minerscan {

/// Rejected address range input. Reported before any network activity.
enum class RangeError {
    InvalidRange = 1,
};

/// Failure of a single identification attempt against one address.
enum class IdentifyError {
    Timeout = 1,
    ConnectionRefused,
    ConnectionReset,
    ProtocolMismatch,   // something answered, but not a supported miner API
};

/// Failure of a control-channel command (start / stop / fault light).
enum class CommandError {
    Unreachable = 1,
    Unsupported,
    Rejected,
};

const std::error_category& rangeCategory() noexcept;
const std::error_category& identifyCategory() noexcept;
const std::error_category& commandCategory() noexcept;

std::error_code make_error_code(RangeError e) noexcept;
std::error_code make_error_code(IdentifyError e) noexcept;
std::error_code make_error_code(CommandError e) noexcept;

/**
 * @brief Whether an identification failure is worth retrying.
 *
 * Timeouts, refused and reset connections (either as IdentifyError values or as
 * the equivalent system errors) are transient. A protocol mismatch, or any
 * error this function does not recognise, is definitive.
 */
bool isTransient(const std::error_code& ec);

/// Maps a socket-level error onto the IdentifyError taxonomy.
std::error_code classifyIdentifyError(const std::error_code& ec);

} // namespace minerscan

namespace std {
template <> struct is_error_code_enum<minerscan::RangeError> : true_type {};
template <> struct is_error_code_enum<minerscan::IdentifyError> : true_type {};
template <> struct is_error_code_enum<minerscan::CommandError> : true_type {};
} // namespace std
