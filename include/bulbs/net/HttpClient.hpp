#pragma once
#include "bulbs/core/Expected.hpp"
#include "bulbs/net/TcpClient.hpp"
#include "bulbs/net/TimeoutConfig.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bulbs::net {

using bulbs::expected;

struct HttpResponse {
    int status = 0;
    std::string reason;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /// Case-insensitive header lookup; first match wins.
    std::optional<std::string> header(std::string_view name) const;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Minimal blocking HTTP/1.1 client for talking to bulbs.
 *
 * Every request opens a fresh connection, sends `Connection: close`, and
 * shares one deadline across resolve/connect/write/read. Errors come back as:
 * - `asio::error::timed_out` when the deadline passes,
 * - socket/resolver error codes for connection problems,
 * - `std::errc::protocol_error` when the response cannot be parsed.
 *
 * Non-2xx statuses are not errors here; callers inspect `HttpResponse::status`.
 */
class HttpClient {
public:
    explicit HttpClient(duration timeout = TimeoutConfig::defaultTimeout());

    void setTimeout(duration timeout) { timeout_ = TimeoutConfig::sanitize(timeout); }
    duration timeout() const { return timeout_; }

    expected<HttpResponse> request(std::string_view method,
                                   const std::string& host,
                                   std::uint16_t port,
                                   std::string_view target,
                                   std::string_view body = {});

    expected<HttpResponse> get(const std::string& host, std::uint16_t port,
                               std::string_view target) {
        return request("GET", host, port, target);
    }

    expected<HttpResponse> put(const std::string& host, std::uint16_t port,
                               std::string_view target, std::string_view body = {}) {
        return request("PUT", host, port, target, body);
    }

private:
    duration timeout_;
};

/// Parse a status line plus header block (without the trailing blank line).
expected<HttpResponse> parseResponseHead(std::string_view head);

/// `Host` header value; IPv6 literals are bracketed.
std::string hostHeader(std::string_view host, std::uint16_t port);

/// Decode a complete `Transfer-Encoding: chunked` payload.
expected<std::string> decodeChunkedBody(std::string_view payload);

} // namespace bulbs::net
