#pragma once

#include <asio.hpp>
#include <system_error>

namespace minerscan::net {

/**
 * @brief Networking aliases so the rest of the project never names Asio directly.
 *
 * Only IPv4 is scanned; `address_v4` is the address type used throughout the
 * scan, registry and poller code.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using address_v4 = asio::ip::address_v4;
using error_code = std::error_code;
using asio::ip::make_address_v4;

} // namespace minerscan::net
