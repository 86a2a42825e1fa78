#pragma once

#include "bulbs/core/BulbsConfig.hpp"
#include "bulbs/core/DeviceAddress.hpp"
#include "bulbs/core/Expected.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace bulbs::core {

/**
 * @brief Finds bulbs on the local network with an SSDP-style M-SEARCH probe.
 *
 * One datagram goes to the probe endpoint (multicast 239.255.255.250:1900 by
 * default; broadcast is enabled so 255.255.255.255 works too). Replies are
 * collected until the overall timeout passes or nothing new arrives within
 * the quiescence window. Until the first device answers the wait is at least
 * the probe's MX reply window, since devices may hold their reply that long.
 *
 * The resolver never touches a DeviceRegistry; callers decide what to merge.
 */
class AddressResolver {
public:
    struct Options {
        std::string probeHost{config::DISCOVERY_MULTICAST_ADDRESS};
        std::uint16_t probePort = config::DISCOVERY_PORT;
        std::string searchTarget{config::DISCOVERY_SEARCH_TARGET};
        std::chrono::milliseconds quiescence = config::DISCOVERY_QUIESCENCE_DEFAULT;
        std::chrono::milliseconds replyWindow = config::DISCOVERY_REPLY_WINDOW;
        std::uint16_t devicePort = config::BULB_HTTP_PORT_DEFAULT; // when a reply has no LOCATION
    };

    AddressResolver();
    explicit AddressResolver(Options options);

    /**
     * @return the responding addresses; an empty set when nothing answered.
     *         Errors are reserved for local socket failures (open/send).
     */
    expected<std::set<DeviceAddress>>
    discover(std::chrono::milliseconds timeout = config::DISCOVERY_TIMEOUT_DEFAULT) const;

    /// The M-SEARCH datagram sent by `discover()`.
    std::string probeMessage() const;

    /**
     * @brief Interpret one reply datagram.
     * @param senderHost source IP of the datagram, used when LOCATION is absent.
     * @return nullopt for anything that is not a matching 200 response.
     */
    std::optional<DeviceAddress> parseReply(std::string_view datagram,
                                            const std::string& senderHost) const;

    const Options& options() const { return options_; }

private:
    Options options_;
};

} // namespace bulbs::core
