#pragma once
#include "bulbs/net/NetConfig.hpp"
#include <thread>
#include <memory>

namespace bulbs::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * All socket and timer handlers run on this one thread. Dispatcher workers
 * never touch the loop directly: they start an async operation and block in
 * `with_deadline` until the handler (or the timer) reports back.
 *
 * Lifetime notes:
 * - Destroy network clients before `NetService` so their handlers complete while
 *   the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 *
 * `shared_io_context()` returns the process-wide instance.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

NetService& ensureNetService();
std::shared_ptr<asio::io_context> shared_io_context();
asio::io_context& io_context();

} // namespace bulbs::net
