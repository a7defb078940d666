#pragma once
#include "minerscan/net/NetConfig.hpp"
#include "minerscan/net/Deadline.hpp"
#include "minerscan/net/TimeoutConfig.hpp"
#include "minerscan/net/NetService.hpp"
#include "minerscan/log/Log.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace minerscan::net {
using duration = TimeoutConfig::duration;

/**
 * @brief Blocking TCP client with per-call deadlines, built on `tcp::socket`.
 *
 * - `connect(...)` reopens the socket and bounds the attempt by a timeout.
 * - `write_all(...)` blocks until done or the deadline fires.
 * - `read_to_end(...)` collects a whole response from request/response
 *   protocols that close the connection after replying (the miner JSON API).
 *
 * Socket work runs on a strand of the shared NetService io_context, which must
 * be running while the client is used. One client serves one thread at a time.
 */
class TcpClient {
public:
    TcpClient()
    : io_(shared_io_context())
    , socket_(*io_)
    , strand_(asio::make_strand(*io_))
    {}

    ~TcpClient() {
        close();
    }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    std::error_code connect(const tcp::endpoint& endpoint, duration timeout) {
        close();
        socket_ = tcp::socket(strand_);
        auto ex = socket_.get_executor();
        return with_deadline(ex, TimeoutConfig::sanitize(timeout),
            [&](auto completion) { socket_.async_connect(endpoint, completion); },
            [&] { cancel(); });
    }

    std::error_code connect(const address_v4& address, unsigned short port, duration timeout) {
        return connect(tcp::endpoint(address, port), timeout);
    }

    std::error_code write_all(const void* buf, std::size_t n, duration timeout) {
        auto ex = socket_.get_executor();
        return with_deadline(ex, TimeoutConfig::sanitize(timeout),
            [&](auto completion) {
                asio::async_write(socket_, asio::buffer(buf, n),
                    [completion](const std::error_code& op_ec, std::size_t) {
                        completion(op_ec);
                    });
            },
            [&] { cancel(); });
    }

    std::error_code write_all(const std::string& payload, duration timeout) {
        return write_all(payload.data(), payload.size(), timeout);
    }

    /**
     * @brief Append everything the peer sends to @p out until it closes the stream.
     *
     * The whole read, not each chunk, is bounded by @p timeout. Reading stops
     * with `message_size` once more than @p maxBytes have arrived. A clean EOF
     * is success.
     */
    std::error_code read_to_end(std::string& out, std::size_t maxBytes, duration timeout) {
        const auto deadline = std::chrono::steady_clock::now() + TimeoutConfig::sanitize(timeout);
        auto chunk = std::make_shared<std::array<char, 4096>>();

        while (true) {
            const auto remaining = std::chrono::duration_cast<duration>(
                deadline - std::chrono::steady_clock::now());
            if (remaining <= duration::zero()) {
                return asio::error::timed_out;
            }

            auto received = std::make_shared<std::size_t>(0);
            auto ex = socket_.get_executor();
            auto ec = with_deadline(ex, remaining,
                [&](auto completion) {
                    socket_.async_read_some(asio::buffer(*chunk),
                        [chunk, received, completion](const std::error_code& op_ec, std::size_t n) {
                            *received = n;
                            completion(op_ec);
                        });
                },
                [&] { cancel(); });

            if (ec == asio::error::timed_out) {
                return ec;
            }
            out.append(chunk->data(), *received);
            if (ec == asio::error::eof) {
                return {};
            }
            if (ec) {
                return ec;
            }
            if (out.size() > maxBytes) {
                return asio::error::message_size;
            }
        }
    }

    void setLowLatency() {
        std::error_code ec;
        socket_.set_option(tcp::no_delay(true), ec);
    }

    // Nudges pending operations to complete now instead of waiting for timeouts.
    void cancel() {
        std::error_code ec;
        socket_.cancel(ec);
    }

    void close() {
        if (!socket_.is_open()) return;
        std::error_code ec;
        // cancel -> shutdown -> close
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

private:
    std::shared_ptr<asio::io_context> io_;
    tcp::socket socket_;
    asio::strand<asio::io_context::executor_type> strand_;
};

} // namespace minerscan::net
