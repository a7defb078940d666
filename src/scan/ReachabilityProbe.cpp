#include "minerscan/scan/ReachabilityProbe.hpp"

#include "minerscan/log/Log.hpp"
#include "minerscan/net/TcpClient.hpp"

namespace minerscan::scan {

const char* toString(ProbeResult result) {
    switch (result) {
        case ProbeResult::Reachable:   return "reachable";
        case ProbeResult::Unreachable: return "unreachable";
        case ProbeResult::TimedOut:    return "timed out";
    }
    return "unknown";
}

TcpPortProbe::TcpPortProbe(unsigned short port)
: port_(port) {}

ProbeResult TcpPortProbe::probe(const net::address_v4& address, std::chrono::milliseconds timeout) {
    net::TcpClient client;
    const auto ec = client.connect(address, port_, timeout);
    client.close();

    if (!ec) {
        return ProbeResult::Reachable;
    }
    if (ec == std::errc::timed_out) {
        return ProbeResult::TimedOut;
    }
    logDebug("[TcpPortProbe] ", address.to_string(), ":", port_, " ", ec.message(), "\n");
    return ProbeResult::Unreachable;
}

} // namespace minerscan::scan
