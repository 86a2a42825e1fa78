// BulbProtocol.hpp
// -----------------------------------------------------------------------------
// Request targets and response decoding for the bulb HTTP API.
//
//   GET /led                       -> {"brightness": 0..1, "color": "#RRGGBB", "on": 0|1}
//   PUT /led/on | /led/off
//   PUT /led/brightness/<0..1>
//   PUT /led/color/RRGGBB
//
// Keeps string building and JSON handling out of BulbClient so the client only
// deals with sequencing and error classification.

#pragma once

#include "bulbs/core/DeviceState.hpp"
#include "bulbs/core/Expected.hpp"
#include "bulbs/core/Rgb.hpp"

#include <string>
#include <string_view>

namespace bulbs::bulb::protocol {

constexpr std::string_view STATUS_PATH = "/led";

std::string powerPath(bool on);
std::string brightnessPath(core::Brightness brightness);   // two decimals, e.g. /led/brightness/0.80
std::string colorPath(const core::Rgb& color);              // no '#', e.g. /led/color/FF0000

/**
 * @brief Decode a status body.
 *
 * Accepts `on` or its alias `enabled`, as 0/1 or a boolean. Missing fields,
 * wrong types, a brightness outside 0..1 or a malformed color yield
 * core::errc::protocol_error. `updatedAt` is set to now.
 */
expected<core::DeviceState> decodeStatus(std::string_view body);

/// Encode a state the way the device reports it (used by test fixtures and logs).
std::string encodeStatus(const core::DeviceState& state);

} // namespace bulbs::bulb::protocol
