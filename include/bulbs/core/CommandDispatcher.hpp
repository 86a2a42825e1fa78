#pragma once

#include "bulbs/core/BulbsConfig.hpp"
#include "bulbs/core/CancellationToken.hpp"
#include "bulbs/core/Command.hpp"
#include "bulbs/core/CommandResult.hpp"
#include "bulbs/core/DeviceTransport.hpp"
#include "bulbs/core/Expected.hpp"
#include "bulbs/net/TimeoutConfig.hpp"

#include <chrono>
#include <cstddef>
#include <memory>

namespace bulbs::core {

/**
 * @brief Sends one Command to all of its targets concurrently.
 *
 * Threading model:
 * - `dispatch()` starts min(targets, maxInFlight) worker threads; each pulls
 *   the next address from a shared atomic cursor and calls the transport.
 *   The worker count is the in-flight bound.
 * - Every request carries its own timeout; a slow device only costs its own
 *   slot.
 * - `dispatch()` joins all workers before returning, so the map is always
 *   complete: exactly one result per target.
 *
 * Cancellation stops workers from picking up new addresses; requests already
 * on the wire run to completion or timeout. Addresses never issued are
 * reported as FailureKind::NotAttempted.
 *
 * The dispatcher holds no device state. Feeding results into a registry is
 * up to the caller (`DeviceRegistry::apply`).
 */
class CommandDispatcher {
public:
    struct Options {
        std::size_t maxInFlight = config::DISPATCH_MAX_IN_FLIGHT_DEFAULT;
        std::chrono::milliseconds requestTimeout = net::TimeoutConfig::defaultTimeout();
    };

    explicit CommandDispatcher(std::shared_ptr<DeviceTransport> transport);
    CommandDispatcher(std::shared_ptr<DeviceTransport> transport, Options options);

    /**
     * @return errc::invalid_command for an empty target set (no transport call
     *         is made); otherwise one result per target.
     */
    expected<ResultMap> dispatch(const Command& command,
                                 const CancellationToken& cancellation = CancellationToken{}) const;

    const Options& options() const { return options_; }

private:
    std::shared_ptr<DeviceTransport> transport_;
    Options options_;
};

} // namespace bulbs::core
