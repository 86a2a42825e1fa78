#pragma once

#include "bulbs/core/DeviceAddress.hpp"
#include "bulbs/core/DeviceState.hpp"
#include "bulbs/core/Expected.hpp"

#include <map>
#include <string>
#include <system_error>

namespace bulbs::core {

enum class FailureKind {
    Timeout,
    ConnectionError,
    ProtocolError,
    NotAttempted    // request never issued (dispatch cancelled first)
};

const char* toString(FailureKind kind);

struct DeviceFailure {
    FailureKind kind = FailureKind::ProtocolError;
    std::error_code cause{};
    std::string detail;

    /// "timeout", or "protocol error: HTTP 500", ...
    std::string describe() const;
};

/// Outcome for one address: the confirmed new state, or why it failed.
using CommandResult = expected<DeviceState, DeviceFailure>;

using ResultMap = std::map<DeviceAddress, CommandResult>;

} // namespace bulbs::core
