#pragma once

#include "bulbs/core/BulbsConfig.hpp"
#include "bulbs/core/Expected.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace bulbs::core {

/**
 * @brief Network endpoint of one bulb (host + HTTP port).
 *
 * Immutable value type. Equality compares host text and port; ordering puts
 * IPv4 hosts first in numeric order, then other hosts alphabetically, so
 * snapshots list `10.0.0.9` before `10.0.0.10`.
 */
class DeviceAddress {
public:
    DeviceAddress(std::string host, std::uint16_t port = config::BULB_HTTP_PORT_DEFAULT);

    /**
     * @brief Parse `host`, `host:port`, `[v6]:port` or `http://host[:port][/path]`.
     * @return errc::invalid_command for an empty host or a bad port.
     */
    static expected<DeviceAddress> parse(std::string_view text);

    const std::string& host() const { return host_; }
    std::uint16_t port() const { return port_; }

    /// `host` when the port is the default, `host:port` otherwise.
    std::string toString() const;

    friend bool operator==(const DeviceAddress& a, const DeviceAddress& b) {
        return a.port_ == b.port_ && a.host_ == b.host_;
    }
    friend bool operator!=(const DeviceAddress& a, const DeviceAddress& b) { return !(a == b); }
    friend bool operator<(const DeviceAddress& a, const DeviceAddress& b);

private:
    std::string host_;
    std::uint16_t port_;
};

std::ostream& operator<<(std::ostream& os, const DeviceAddress& address);

} // namespace bulbs::core
