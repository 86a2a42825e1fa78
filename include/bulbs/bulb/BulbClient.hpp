#pragma once

#include "bulbs/core/CommandResult.hpp"
#include "bulbs/core/DeviceTransport.hpp"
#include "bulbs/net/HttpClient.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace bulbs::bulb {

/**
 * @brief DeviceTransport that speaks the bulb HTTP API.
 *
 * Each call opens its own connection, so one instance can be shared by all
 * dispatcher workers. The timeout bounds the whole operation: every HTTP
 * exchange it needs (a write plus its confirming read, or a toggle's three
 * requests) draws on one deadline.
 *
 * Sequencing:
 * - QueryStatus: GET /led.
 * - SetPower / SetBrightness / SetColor: PUT, then take the state from the
 *   response body if it is a status object, else confirm with GET /led.
 * - Toggle: GET /led, PUT the opposite power, confirm as above.
 *
 * Error classes: deadline -> Timeout; resolver/socket -> ConnectionError;
 * unparsable response, non-2xx status or bad JSON -> ProtocolError.
 */
class BulbClient : public core::DeviceTransport {
public:
    using Clock = std::chrono::steady_clock;
    using Deadline = Clock::time_point;

    BulbClient() = default;

    core::CommandResult execute(const core::DeviceAddress& address,
                                const core::Operation& operation,
                                std::chrono::milliseconds timeout) override;

    core::CommandResult queryStatus(const core::DeviceAddress& address,
                                    std::chrono::milliseconds timeout);
    core::CommandResult setPower(const core::DeviceAddress& address, bool on,
                                 std::chrono::milliseconds timeout);
    core::CommandResult setBrightness(const core::DeviceAddress& address,
                                      core::Brightness brightness,
                                      std::chrono::milliseconds timeout);
    core::CommandResult setColor(const core::DeviceAddress& address, const core::Rgb& color,
                                 std::chrono::milliseconds timeout);
    core::CommandResult toggle(const core::DeviceAddress& address,
                               std::chrono::milliseconds timeout);

private:
    core::CommandResult fetchStatus(const core::DeviceAddress& address, Deadline deadline);

    /// PUT @p target and return the state the device ends up in.
    core::CommandResult write(const core::DeviceAddress& address, std::string_view target,
                              Deadline deadline);

    core::CommandResult flipPower(const core::DeviceAddress& address, Deadline deadline);

    static core::DeviceFailure classify(const core::DeviceAddress& address,
                                        const std::error_code& ec);
};

} // namespace bulbs::bulb
