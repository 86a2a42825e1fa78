#include "bulbs/core/DeviceAddress.hpp"

#include "bulbs/core/Error.hpp"
#include "bulbs/net/NetConfig.hpp"

#include <charconv>
#include <optional>
#include <tuple>

namespace bulbs::core {

namespace {

std::optional<std::uint32_t> ipv4Value(const std::string& host) {
    std::error_code ec;
    auto v4 = net::asio::ip::make_address_v4(host, ec);
    if (ec) {
        return std::nullopt;
    }
    return v4.to_uint();
}

std::optional<std::uint16_t> parsePort(std::string_view text) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() ||
        value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace

DeviceAddress::DeviceAddress(std::string host, std::uint16_t port)
: host_(std::move(host))
, port_(port)
{}

expected<DeviceAddress> DeviceAddress::parse(std::string_view text) {
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ') text.remove_suffix(1);

    if (text.substr(0, 7) == "http://") {
        text.remove_prefix(7);
    }
    if (auto slash = text.find('/'); slash != std::string_view::npos) {
        text = text.substr(0, slash);
    }

    std::string_view host = text;
    std::uint16_t port = config::BULB_HTTP_PORT_DEFAULT;

    if (!text.empty() && text.front() == '[') {
        const auto close = text.find(']');
        if (close == std::string_view::npos) {
            return unexpected(make_error_code(errc::invalid_command));
        }
        host = text.substr(1, close - 1);
        auto rest = text.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return unexpected(make_error_code(errc::invalid_command));
            }
            auto parsed = parsePort(rest.substr(1));
            if (!parsed) {
                return unexpected(make_error_code(errc::invalid_command));
            }
            port = *parsed;
        }
    } else if (auto colon = text.rfind(':'); colon != std::string_view::npos) {
        if (text.find(':') != colon) {
            // bare IPv6 literal without brackets: no port
            host = text;
        } else {
            host = text.substr(0, colon);
            auto parsed = parsePort(text.substr(colon + 1));
            if (!parsed) {
                return unexpected(make_error_code(errc::invalid_command));
            }
            port = *parsed;
        }
    }

    if (host.empty()) {
        return unexpected(make_error_code(errc::invalid_command));
    }
    return DeviceAddress(std::string(host), port);
}

std::string DeviceAddress::toString() const {
    const bool v6 = host_.find(':') != std::string::npos;
    if (port_ == config::BULB_HTTP_PORT_DEFAULT) {
        return host_;
    }
    if (v6) {
        return "[" + host_ + "]:" + std::to_string(port_);
    }
    return host_ + ":" + std::to_string(port_);
}

bool operator<(const DeviceAddress& a, const DeviceAddress& b) {
    const auto av4 = ipv4Value(a.host_);
    const auto bv4 = ipv4Value(b.host_);
    if (av4 && bv4) {
        return std::tie(*av4, a.port_) < std::tie(*bv4, b.port_);
    }
    if (av4.has_value() != bv4.has_value()) {
        return av4.has_value(); // IPv4 before names
    }
    return std::tie(a.host_, a.port_) < std::tie(b.host_, b.port_);
}

std::ostream& operator<<(std::ostream& os, const DeviceAddress& address) {
    return os << address.toString();
}

} // namespace bulbs::core
