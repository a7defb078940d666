#pragma once
#include "minerscan/net/NetConfig.hpp"

#include <chrono>

namespace minerscan::scan {

enum class ProbeResult {
    Reachable,
    Unreachable,
    TimedOut,
};

const char* toString(ProbeResult result);

/**
 * @brief Cheap pre-filter run before identification.
 *
 * Must be callable from many sweep workers at once.
 */
class ReachabilityProbe {
public:
    virtual ~ReachabilityProbe() = default;

    virtual ProbeResult probe(const net::address_v4& address, std::chrono::milliseconds timeout) = 0;
};

/// Plain TCP connect to the control port; the connection is closed straight away.
class TcpPortProbe : public ReachabilityProbe {
public:
    explicit TcpPortProbe(unsigned short port);

    ProbeResult probe(const net::address_v4& address, std::chrono::milliseconds timeout) override;

    unsigned short port() const { return port_; }

private:
    unsigned short port_;
};

} // namespace minerscan::scan
