#include "minerscan/net/NetService.hpp"
#include "minerscan/log/Log.hpp"

#include <algorithm>

namespace minerscan::net {

namespace {
NetService& static_service() {
    static NetService service;
    return service;
}
} // namespace

NetService::NetService(std::size_t threadCount)
: io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
{
    threadCount = std::max<std::size_t>(threadCount, 1);
    threads_.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        threads_.emplace_back([io = io_] { io->run(); });
    }
    logDebug("[NetService] started ", threadCount, " I/O thread(s)\n");
}

NetService::~NetService() {
    work_guard_.reset();
    io_->stop();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

NetService& ensureNetService() {
    return static_service();
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return static_service().io();
}

} // namespace minerscan::net
