#include "minerscan/core/Errors.hpp"

namespace minerscan {

namespace {

class RangeCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "minerscan.range"; }

    std::string message(int value) const override {
        switch (static_cast<RangeError>(value)) {
            case RangeError::InvalidRange:
                return "invalid address range";
        }
        return "unknown range error";
    }
};

class IdentifyCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "minerscan.identify"; }

    std::string message(int value) const override {
        switch (static_cast<IdentifyError>(value)) {
            case IdentifyError::Timeout:           return "identification timed out";
            case IdentifyError::ConnectionRefused: return "connection refused";
            case IdentifyError::ConnectionReset:   return "connection reset";
            case IdentifyError::ProtocolMismatch:  return "not a supported device";
        }
        return "unknown identify error";
    }
};

class CommandCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "minerscan.command"; }

    std::string message(int value) const override {
        switch (static_cast<CommandError>(value)) {
            case CommandError::Unreachable: return "device unreachable";
            case CommandError::Unsupported: return "command not supported by device";
            case CommandError::Rejected:    return "command rejected by device";
        }
        return "unknown command error";
    }
};

} // namespace

const std::error_category& rangeCategory() noexcept {
    static const RangeCategory category;
    return category;
}

const std::error_category& identifyCategory() noexcept {
    static const IdentifyCategory category;
    return category;
}

const std::error_category& commandCategory() noexcept {
    static const CommandCategory category;
    return category;
}

std::error_code make_error_code(RangeError e) noexcept {
    return {static_cast<int>(e), rangeCategory()};
}

std::error_code make_error_code(IdentifyError e) noexcept {
    return {static_cast<int>(e), identifyCategory()};
}

std::error_code make_error_code(CommandError e) noexcept {
    return {static_cast<int>(e), commandCategory()};
}

bool isTransient(const std::error_code& ec) {
    if (!ec) {
        return false;
    }
    if (ec.category() == identifyCategory()) {
        return ec != IdentifyError::ProtocolMismatch;
    }
    return ec == std::errc::timed_out
        || ec == std::errc::connection_refused
        || ec == std::errc::connection_reset
        || ec == std::errc::connection_aborted
        || ec == std::errc::host_unreachable
        || ec == std::errc::network_unreachable
        || ec == std::errc::broken_pipe;
}

std::error_code classifyIdentifyError(const std::error_code& ec) {
    if (!ec || ec.category() == identifyCategory()) {
        return ec;
    }
    if (ec == std::errc::connection_refused
        || ec == std::errc::host_unreachable
        || ec == std::errc::network_unreachable) {
        return IdentifyError::ConnectionRefused;
    }
    if (ec == std::errc::connection_reset
        || ec == std::errc::connection_aborted
        || ec == std::errc::broken_pipe) {
        return IdentifyError::ConnectionReset;
    }
    if (ec == std::errc::timed_out || ec == std::errc::operation_canceled) {
        return IdentifyError::Timeout;
    }
    return IdentifyError::ProtocolMismatch;
}

} // namespace minerscan
