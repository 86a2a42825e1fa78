#pragma once

#include "bulbs/core/Command.hpp"
#include "bulbs/core/CommandResult.hpp"
#include "bulbs/core/DeviceAddress.hpp"

#include <chrono>

namespace bulbs::core {

/**
 * @brief Executes one operation against one device.
 *
 * Implementations must be safe to call from several dispatcher workers at
 * once and must report every problem through the returned CommandResult
 * (never by throwing). A success carries the state the device confirmed.
 */
class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;

    virtual CommandResult execute(const DeviceAddress& address,
                                  const Operation& operation,
                                  std::chrono::milliseconds timeout) = 0;
};

} // namespace bulbs::core
