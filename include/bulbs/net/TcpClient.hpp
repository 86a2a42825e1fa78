#pragma once
#include "bulbs/net/NetConfig.hpp"
#include "bulbs/net/Deadline.hpp"
#include "bulbs/net/TimeoutConfig.hpp"
#include "bulbs/net/NetService.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace bulbs::net {
using duration = TimeoutConfig::duration;

/**
 * @brief Thin wrapper around `tcp::socket` that adds deadlines to every call.
 *
 * Highlights:
 * - `connect(...)` tries each endpoint in turn and respects a per-attempt timeout.
 * - `read_until(...)`, `read_exactly(...)`, `read_to_eof(...)` and `write_all(...)`
 *   block the caller while enforcing deadlines.
 * - All socket work is serialized by a strand executor.
 *
 * One client is used by one thread at a time. The owning `asio::io_context`
 * must be running while the API is in use.
 */
class TcpClient {
public:
    TcpClient()
    : io_(shared_io_context())
    , strand_(asio::make_strand(*io_))
    , socket_(strand_)
    {}

    ~TcpClient() { close(); }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    std::error_code connect(const tcp::endpoint& endpoint, duration timeout) {
        close();
        socket_ = tcp::socket(strand_);
        return connect_one(endpoint, timeout);
    }

    // Resolver results: try each entry until one connects.
    std::error_code connect(const tcp::resolver::results_type& results, duration timeout) {
        std::error_code last = asio::error::host_not_found;

        for (const auto& entry : results) {
            auto ec = connect(entry.endpoint(), timeout);
            if (!ec) return ec;   // success
            last = ec;            // remember last error and try next
        }
        return last;
    }

    std::error_code write_all(const void* buf, std::size_t n, duration timeout) {
        return with_deadline(socket_.get_executor(), TimeoutConfig::sanitize(timeout),
            [&](auto completion){
                asio::async_write(socket_, asio::buffer(buf, n),
                    [completion](const std::error_code& op_ec, std::size_t){
                        completion(op_ec);
                    });
            },
            [&]{ cancel(); }
        );
    }

    std::error_code write_all(std::string_view data, duration timeout) {
        return write_all(data.data(), data.size(), timeout);
    }

    /**
     * Append to @p buffer until it contains @p delimiter. Bytes past the
     * delimiter may also be appended; @p endOfMatch receives the offset just
     * past the delimiter.
     */
    std::error_code read_until(std::string& buffer, std::string_view delimiter,
                               duration timeout, std::size_t* endOfMatch = nullptr) {
        std::size_t matched = 0;
        auto ec = with_deadline(socket_.get_executor(), TimeoutConfig::sanitize(timeout),
            [&](auto completion){
                asio::async_read_until(socket_, asio::dynamic_buffer(buffer),
                    std::string(delimiter),
                    [&matched, completion](const std::error_code& op_ec, std::size_t n){
                        matched = n;
                        completion(op_ec);
                    });
            },
            [&]{ cancel(); }
        );
        if (endOfMatch) {
            *endOfMatch = matched;
        }
        return ec;
    }

    /// Append exactly @p n more bytes to @p buffer.
    std::error_code read_exactly(std::string& buffer, std::size_t n, duration timeout) {
        return with_deadline(socket_.get_executor(), TimeoutConfig::sanitize(timeout),
            [&](auto completion){
                asio::async_read(socket_, asio::dynamic_buffer(buffer),
                    asio::transfer_exactly(n),
                    [completion](const std::error_code& op_ec, std::size_t){
                        completion(op_ec);
                    });
            },
            [&]{ cancel(); }
        );
    }

    /// Append everything until the peer closes. A clean EOF is success.
    std::error_code read_to_eof(std::string& buffer, duration timeout) {
        auto ec = with_deadline(socket_.get_executor(), TimeoutConfig::sanitize(timeout),
            [&](auto completion){
                asio::async_read(socket_, asio::dynamic_buffer(buffer),
                    [completion](const std::error_code& op_ec, std::size_t){
                        completion(op_ec);
                    });
            },
            [&]{ cancel(); }
        );
        if (ec == asio::error::eof) {
            return {};
        }
        return ec;
    }

    void setLowLatency() {
        std::error_code ec;
        socket_.set_option(tcp::no_delay(true), ec);
    }

    // Best-effort cancellation of pending ops on the socket.
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
    std::error_code connect_one(const tcp::endpoint& ep, duration timeout) {
        return with_deadline(socket_.get_executor(), TimeoutConfig::sanitize(timeout),
            [&](auto completion){ socket_.async_connect(ep, completion); },
            [&]{ cancel(); }
        );
    }

    std::shared_ptr<asio::io_context> io_;
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::socket socket_;
};

} // namespace bulbs::net
