#pragma once
#include "bulbs/net/NetConfig.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace bulbs::net {

/**
 * resolve
 *
 * Deadline-bounded DNS lookup. Given `host` and `service` (e.g.
 * "bulb-kitchen.local", "80") it fills a list of endpoints for the TCP
 * client overload that accepts resolver results. Numeric hosts resolve
 * without touching DNS.
 *
 * The lookup runs on Asio's resolver thread. When `timeout` passes first the
 * call returns `asio::error::timed_out` straight away; the abandoned lookup
 * finishes in the background and only touches state it shares ownership of.
 * The io_context must be running.
 */
inline error_code resolve(
    asio::io_context& io,
    const std::string& host,
    const std::string& service,
    std::chrono::milliseconds timeout,
    tcp::resolver::results_type& out)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        error_code ec;
        tcp::resolver::results_type results;
    };

    auto st = std::make_shared<State>();
    auto resolver = std::make_shared<tcp::resolver>(io);

    resolver->async_resolve(host, service,
        [st, resolver](const error_code& ec, tcp::resolver::results_type results) {
            {
                std::lock_guard<std::mutex> lk(st->m);
                st->ec = ec;
                st->results = std::move(results);
                st->done = true;
            }
            st->cv.notify_one();
        });

    std::unique_lock<std::mutex> lk(st->m);
    if (!st->cv.wait_for(lk, timeout, [&]{ return st->done; })) {
        lk.unlock();
        asio::post(io, [resolver]{ resolver->cancel(); });
        return asio::error::timed_out;
    }
    out = std::move(st->results);
    return st->ec;
}

} // namespace bulbs::net
