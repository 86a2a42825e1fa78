#pragma once
#include "bulbs/net/NetConfig.hpp"
#include "bulbs/net/Deadline.hpp"

#include <chrono>
#include <cstdint>

namespace bulbs::net {

/**
 * UdpSocket
 *
 * Small helper for the discovery probe: broadcast/multicast send and
 * receive-with-timeout, using the same `with_deadline` pattern as TCP.
 */
class UdpSocket {
public:
    explicit UdpSocket(asio::io_context& io) : sock_(io) {}
    ~UdpSocket() { close(); }

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    error_code open_v4() {
        error_code ec;
        sock_.open(udp::v4(), ec);
        return ec;
    }

    error_code bind_any(std::uint16_t port) {
        error_code ec;
        sock_.bind(udp::endpoint(udp::v4(), port), ec);
        return ec;
    }

    error_code enable_broadcast(bool on = true) {
        error_code ec;
        sock_.set_option(asio::socket_base::broadcast(on), ec);
        return ec;
    }

    error_code set_multicast_hops(int hops) {
        error_code ec;
        sock_.set_option(asio::ip::multicast::hops(hops), ec);
        return ec;
    }

    // Send a datagram, fail if not sent within timeout.
    error_code send_to(const void* data, std::size_t n,
                       const udp::endpoint& ep, milliseconds timeout) {
        return with_deadline(sock_.get_executor(), timeout,
            [&](auto cb){
                sock_.async_send_to(asio::buffer(data, n), ep,
                    [cb](const error_code& ec, std::size_t){ cb(ec); });
            },
            [&]{ cancel(); });
    }

    // Receive one datagram, with timeout. Returns ec + fills out_ep + out_n.
    error_code recv_from(void* data, std::size_t max,
                         udp::endpoint& out_ep, std::size_t& out_n,
                         milliseconds timeout) {
        out_n = 0;
        return with_deadline(sock_.get_executor(), timeout,
            [&](auto cb){
                sock_.async_receive_from(asio::buffer(data, max), out_ep,
                    [&out_n, cb](const error_code& ec, std::size_t n){
                        out_n = n; cb(ec);
                    });
            },
            [&]{ cancel(); });
    }

    void cancel() { error_code ignore; sock_.cancel(ignore); }
    void close() { error_code ignore; sock_.close(ignore); }

private:
    udp::socket sock_;
};

} // namespace bulbs::net
