#pragma once

#include <asio.hpp>
#include <chrono>
#include <system_error>   // std::error_code

namespace bulbs::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `bulbs::net::asio` as the standalone Asio namespace.
 * - `bulbs::net::tcp` and `bulbs::net::udp` as protocol aliases.
 * - `error_code` / `milliseconds` used by every blocking helper in this layer.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using udp = asio::ip::udp;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace bulbs::net
