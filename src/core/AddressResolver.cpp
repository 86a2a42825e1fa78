#include "bulbs/core/AddressResolver.hpp"

#include "bulbs/core/Error.hpp"
#include "bulbs/log/Log.hpp"
#include "bulbs/net/NetService.hpp"
#include "bulbs/net/UdpSocket.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace bulbs::core {

namespace net = bulbs::net;

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<std::string_view> headerValue(std::string_view message, std::string_view name) {
    std::size_t pos = message.find('\n');
    while (pos != std::string_view::npos) {
        const auto next = message.find('\n', pos + 1);
        auto line = message.substr(pos + 1, next == std::string_view::npos ? next : next - pos - 1);
        const auto colon = line.find(':');
        if (colon != std::string_view::npos && equalsIgnoreCase(trim(line.substr(0, colon)), name)) {
            return trim(line.substr(colon + 1));
        }
        pos = next;
    }
    return std::nullopt;
}

} // namespace

AddressResolver::AddressResolver()
: AddressResolver(Options{})
{}

AddressResolver::AddressResolver(Options options)
: options_(std::move(options))
{}

std::string AddressResolver::probeMessage() const {
    std::ostringstream os;
    os << "M-SEARCH * HTTP/1.1\r\n"
       << "HOST: " << options_.probeHost << ':' << options_.probePort << "\r\n"
       << "MAN: \"ssdp:discover\"\r\n"
       << "MX: " << config::DISCOVERY_MX_SECONDS << "\r\n"
       << "ST: " << options_.searchTarget << "\r\n"
       << "\r\n";
    return os.str();
}

std::optional<DeviceAddress>
AddressResolver::parseReply(std::string_view datagram, const std::string& senderHost) const {
    const auto firstLine = trim(datagram.substr(0, datagram.find('\n')));
    if (firstLine.substr(0, 9) != "HTTP/1.1 " || firstLine.substr(9, 3) != "200") {
        return std::nullopt;
    }

    if (auto st = headerValue(datagram, "ST")) {
        if (!equalsIgnoreCase(*st, options_.searchTarget) && !equalsIgnoreCase(*st, "ssdp:all")) {
            return std::nullopt;
        }
    }

    if (auto location = headerValue(datagram, "LOCATION")) {
        if (auto parsed = DeviceAddress::parse(*location)) {
            return *parsed;
        }
        logDebug("[AddressResolver] ignoring bad LOCATION '", *location, "' from ", senderHost, "\n");
    }

    if (senderHost.empty()) {
        return std::nullopt;
    }
    return DeviceAddress(senderHost, options_.devicePort);
}

expected<std::set<DeviceAddress>>
AddressResolver::discover(std::chrono::milliseconds timeout) const {
    net::UdpSocket socket(net::io_context());

    if (auto ec = socket.open_v4(); ec) {
        logError("[AddressResolver] open failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    if (auto ec = socket.bind_any(0); ec) {
        logError("[AddressResolver] bind failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    // Not fatal: unicast probes still work without either option.
    if (auto ec = socket.enable_broadcast(); ec) {
        logDebug("[AddressResolver] broadcast option: ", ec.message(), "\n");
    }
    if (auto ec = socket.set_multicast_hops(2); ec) {
        logDebug("[AddressResolver] multicast hops option: ", ec.message(), "\n");
    }

    std::error_code addrEc;
    const auto probeAddress = net::asio::ip::make_address(options_.probeHost, addrEc);
    if (addrEc) {
        logError("[AddressResolver] bad probe address '", options_.probeHost, "'\n");
        return unexpected(make_error_code(errc::invalid_command));
    }
    const net::udp::endpoint probe(probeAddress, options_.probePort);

    const auto message = probeMessage();
    if (auto ec = socket.send_to(message.data(), message.size(), probe, config::DISCOVERY_SEND_TIMEOUT); ec) {
        logError("[AddressResolver] probe to ", options_.probeHost, ':', options_.probePort,
                 " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }

    std::set<DeviceAddress> found;
    std::array<char, config::DISCOVERY_MAX_DATAGRAM> buffer{};
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            break;
        }

        net::udp::endpoint sender;
        std::size_t received = 0;
        const auto quiet = found.empty() ? std::max(options_.quiescence, options_.replyWindow)
                                         : options_.quiescence;
        const auto wait = std::min(left, quiet);
        auto ec = socket.recv_from(buffer.data(), buffer.size(), sender, received, wait);
        if (ec == net::asio::error::timed_out) {
            break; // quiet long enough
        }
        if (ec) {
            logError("[AddressResolver] receive failed: ", ec.message(), "\n");
            break;
        }

        const std::string senderHost = sender.address().to_string();
        if (auto address = parseReply(std::string_view(buffer.data(), received), senderHost)) {
            if (found.insert(*address).second) {
                logDebug("[AddressResolver] found ", *address, " (from ", senderHost, ")\n");
            }
        }
    }

    if (found.empty()) {
        const std::error_code info = make_error_code(errc::discovery_timeout);
        logDebug("[AddressResolver] ", info.message(), "\n");
    }
    return found;
}

} // namespace bulbs::core
