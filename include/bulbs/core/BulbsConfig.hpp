#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace bulbs::core::config {

/**
 * @brief Constants that define bulb networking, discovery and dispatch behaviour.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * translation units and makes it easy to tune the integration in one place.
 */

// Devices ---------------------------------------------------------------------
constexpr std::uint16_t BULB_HTTP_PORT_DEFAULT = 80;
constexpr int BRIGHTNESS_MAX = 100;          // wire value is brightness / BRIGHTNESS_MAX

// Dispatch --------------------------------------------------------------------
constexpr std::size_t DISPATCH_MAX_IN_FLIGHT_DEFAULT = 16;
constexpr std::size_t DISPATCH_MAX_IN_FLIGHT_CAP = 64;

// Discovery (SSDP-style M-SEARCH) ---------------------------------------------
constexpr std::string_view DISCOVERY_MULTICAST_ADDRESS = "239.255.255.250";
constexpr std::uint16_t DISCOVERY_PORT = 1900;
constexpr std::string_view DISCOVERY_SEARCH_TARGET = "urn:bulbs-tui:device:bulb:1";
constexpr std::chrono::milliseconds DISCOVERY_TIMEOUT_DEFAULT{2000};
constexpr std::chrono::milliseconds DISCOVERY_QUIESCENCE_DEFAULT{200};
constexpr int DISCOVERY_MX_SECONDS = 1;     // devices spread replies over [0, MX] s
constexpr std::chrono::milliseconds DISCOVERY_REPLY_WINDOW{DISCOVERY_MX_SECONDS * 1000};
constexpr std::chrono::milliseconds DISCOVERY_SEND_TIMEOUT{250};
constexpr std::size_t DISCOVERY_MAX_DATAGRAM = 1500;

} // namespace bulbs::core::config
