#include "bulbs/net/HttpClient.hpp"

#include "bulbs/log/Log.hpp"
#include "bulbs/net/Resolve.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <sstream>

namespace bulbs::net {

namespace {

constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

std::error_code protocolError() {
    return std::make_error_code(std::errc::protocol_error);
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// Remaining budget until the shared deadline, or nullopt once it has passed.
std::optional<duration> remaining(std::chrono::steady_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<duration>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
        return std::nullopt;
    }
    return left;
}

} // namespace

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (equalsIgnoreCase(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

expected<HttpResponse> parseResponseHead(std::string_view head) {
    HttpResponse response;

    auto lineEnd = head.find("\r\n");
    std::string_view statusLine = head.substr(0, lineEnd);

    // HTTP/1.x SP 3DIGIT [SP reason]
    if (statusLine.size() < 12 || statusLine.substr(0, 7) != "HTTP/1." || statusLine[8] != ' ') {
        return unexpected(protocolError());
    }
    const auto codeText = statusLine.substr(9, 3);
    int status = 0;
    auto [ptr, ec] = std::from_chars(codeText.data(), codeText.data() + codeText.size(), status);
    if (ec != std::errc{} || ptr != codeText.data() + codeText.size() || status < 100 || status > 999) {
        return unexpected(protocolError());
    }
    response.status = status;
    if (statusLine.size() > 13) {
        response.reason = std::string(trim(statusLine.substr(13)));
    }

    while (lineEnd != std::string_view::npos) {
        head.remove_prefix(lineEnd + 2);
        lineEnd = head.find("\r\n");
        std::string_view line = head.substr(0, lineEnd);
        if (line.empty()) {
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return unexpected(protocolError());
        }
        response.headers.emplace_back(std::string(trim(line.substr(0, colon))),
                                      std::string(trim(line.substr(colon + 1))));
    }
    return response;
}

expected<std::string> decodeChunkedBody(std::string_view payload) {
    std::string out;
    while (true) {
        const auto lineEnd = payload.find("\r\n");
        if (lineEnd == std::string_view::npos) {
            return unexpected(protocolError());
        }
        auto sizeText = payload.substr(0, lineEnd);
        if (auto ext = sizeText.find(';'); ext != std::string_view::npos) {
            sizeText = sizeText.substr(0, ext);
        }
        sizeText = trim(sizeText);
        std::size_t chunkSize = 0;
        auto [ptr, ec] = std::from_chars(sizeText.data(), sizeText.data() + sizeText.size(),
                                         chunkSize, 16);
        if (sizeText.empty() || ec != std::errc{} || ptr != sizeText.data() + sizeText.size()) {
            return unexpected(protocolError());
        }
        payload.remove_prefix(lineEnd + 2);
        if (chunkSize == 0) {
            return out; // trailers, if any, are ignored
        }
        if (payload.size() < chunkSize + 2 || payload.substr(chunkSize, 2) != "\r\n") {
            return unexpected(protocolError());
        }
        out.append(payload.substr(0, chunkSize));
        payload.remove_prefix(chunkSize + 2);
    }
}

std::string hostHeader(std::string_view host, std::uint16_t port) {
    std::string out;
    if (host.find(':') != std::string_view::npos) {
        out.append("[").append(host).append("]");
    } else {
        out.append(host);
    }
    return out + ':' + std::to_string(port);
}

HttpClient::HttpClient(duration timeout)
: timeout_(TimeoutConfig::sanitize(timeout))
{}

expected<HttpResponse> HttpClient::request(std::string_view method,
                                           const std::string& host,
                                           std::uint16_t port,
                                           std::string_view target,
                                           std::string_view body) {
    const auto deadline = std::chrono::steady_clock::now() + timeout_;

    auto left = remaining(deadline);
    if (!left) {
        return unexpected(std::error_code(asio::error::timed_out));
    }
    tcp::resolver::results_type endpoints;
    if (auto ec = resolve(io_context(), host, std::to_string(port), *left, endpoints); ec) {
        logDebug("[HttpClient] resolve ", host, " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }

    TcpClient client;
    if (!(left = remaining(deadline))) {
        return unexpected(std::error_code(asio::error::timed_out));
    }
    if (auto ec = client.connect(endpoints, *left); ec) {
        logDebug("[HttpClient] connect ", host, ":", port, " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    client.setLowLatency();

    std::ostringstream req;
    req << method << ' ' << target << " HTTP/1.1\r\n"
        << "Host: " << hostHeader(host, port) << "\r\n"
        << "User-Agent: bulbs-tui\r\n"
        << "Accept: application/json\r\n"
        << "Connection: close\r\n"
        << "Content-Length: " << body.size() << "\r\n\r\n"
        << body;
    const std::string wire = req.str();

    if (!(left = remaining(deadline))) {
        return unexpected(std::error_code(asio::error::timed_out));
    }
    if (auto ec = client.write_all(wire, *left); ec) {
        return unexpected(ec);
    }

    std::string buffer;
    std::size_t headEnd = 0;
    if (!(left = remaining(deadline))) {
        return unexpected(std::error_code(asio::error::timed_out));
    }
    if (auto ec = client.read_until(buffer, kHeaderTerminator, *left, &headEnd); ec) {
        if (ec == asio::error::eof) {
            logDebug("[HttpClient] ", host, " closed before sending headers\n");
            return unexpected(protocolError());
        }
        return unexpected(ec);
    }

    auto response = parseResponseHead(
        std::string_view(buffer).substr(0, headEnd - kHeaderTerminator.size()));
    if (!response) {
        logDebug("[HttpClient] malformed response head from ", host, "\n");
        return response;
    }

    std::string payload = buffer.substr(headEnd);
    const bool bodyless = method == "HEAD" || response->status == 204 ||
                          response->status == 304 || response->status < 200;

    if (!bodyless) {
        const auto transferEncoding = response->header("Transfer-Encoding");
        const auto contentLength = response->header("Content-Length");
        if (!(left = remaining(deadline))) {
            return unexpected(std::error_code(asio::error::timed_out));
        }

        if (transferEncoding && equalsIgnoreCase(trim(*transferEncoding), "chunked")) {
            if (auto ec = client.read_to_eof(payload, *left); ec) {
                return unexpected(ec);
            }
            auto decoded = decodeChunkedBody(payload);
            if (!decoded) {
                return unexpected(decoded.error());
            }
            payload = std::move(*decoded);
        } else if (contentLength) {
            std::size_t length = 0;
            const auto text = trim(*contentLength);
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), length);
            if (ec != std::errc{} || ptr != text.data() + text.size()) {
                return unexpected(protocolError());
            }
            if (payload.size() < length) {
                if (auto readEc = client.read_exactly(payload, length - payload.size(), *left); readEc) {
                    return unexpected(readEc == asio::error::eof ? protocolError() : readEc);
                }
            }
            payload.resize(length);
        } else {
            if (auto ec = client.read_to_eof(payload, *left); ec) {
                return unexpected(ec);
            }
        }
    }

    response->body = std::move(payload);
    logDebug("[HttpClient] ", method, ' ', host, ':', port, target,
             " -> ", response->status, " (", response->body.size(), " bytes)\n");
    return response;
}

} // namespace bulbs::net
