#pragma once
#include "minerscan/net/NetConfig.hpp"

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace minerscan::net {

/**
 * @brief Owns an `asio::io_context` and the threads that run it.
 *
 * Sweep workers and pollers block in `with_deadline` while the I/O threads run
 * the completion handlers. Handlers are short (record a result, cancel a
 * timer), so a couple of I/O threads serve hundreds of blocked workers.
 *
 * Lifetime notes:
 * - Destroy sockets before the service so their handlers run while the
 *   io_context is still alive.
 * - The destructor releases the work guard, stops the context and joins.
 */
class NetService {
public:
    explicit NetService(std::size_t threadCount = 2);
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }
    std::size_t threadCount() const { return threads_.size(); }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> threads_;
};

/// Process-wide service, created on first use.
NetService& ensureNetService();
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace minerscan::net
