#pragma once

#include <string>
#include <system_error>

namespace bulbs::core {

enum class errc {
    invalid_command = 1,   // empty target set or out-of-range payload
    device_unreachable,
    protocol_error,
    discovery_timeout,     // informational: nothing answered the probe
    config_error
};

const std::error_category& bulbs_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

} // namespace bulbs::core

namespace std {
template <>
struct is_error_code_enum<bulbs::core::errc> : true_type {};
} // namespace std
