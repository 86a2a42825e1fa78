#include "bulbs/core/CommandDispatcher.hpp"

#include "bulbs/core/Error.hpp"
#include "bulbs/log/Log.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <thread>
#include <vector>

namespace bulbs::core {

namespace {

std::size_t clampInFlight(std::size_t requested) {
    return std::clamp<std::size_t>(requested, 1, config::DISPATCH_MAX_IN_FLIGHT_CAP);
}

} // namespace

CommandDispatcher::CommandDispatcher(std::shared_ptr<DeviceTransport> transport)
: CommandDispatcher(std::move(transport), Options{})
{}

CommandDispatcher::CommandDispatcher(std::shared_ptr<DeviceTransport> transport, Options options)
: transport_(std::move(transport))
, options_(options)
{
    options_.maxInFlight = clampInFlight(options_.maxInFlight);
    options_.requestTimeout = net::TimeoutConfig::sanitize(options_.requestTimeout);
}

expected<ResultMap> CommandDispatcher::dispatch(const Command& command,
                                                const CancellationToken& cancellation) const {
    if (command.targets.empty()) {
        logError("[CommandDispatcher] refusing '", describe(command.operation),
                 "' with no targets\n");
        return unexpected(make_error_code(errc::invalid_command));
    }
    if (!transport_) {
        return unexpected(make_error_code(errc::invalid_command));
    }

    const std::vector<DeviceAddress> targets(command.targets.begin(), command.targets.end());
    // One slot per target, written by exactly one worker.
    std::vector<std::optional<CommandResult>> slots(targets.size());
    std::atomic<std::size_t> cursor{0};

    auto worker = [&] {
        while (true) {
            if (cancellation.cancelled()) {
                return;
            }
            const std::size_t index = cursor.fetch_add(1, std::memory_order_relaxed);
            if (index >= targets.size()) {
                return;
            }
            const auto& address = targets[index];
            logDebug("[CommandDispatcher] ", describe(command.operation), " -> ", address, "\n");
            try {
                slots[index] = transport_->execute(address, command.operation, options_.requestTimeout);
            } catch (const std::exception& e) {
                // A throwing transport still only fails its own address.
                logError("[CommandDispatcher] transport threw for ", address, ": ", e.what(), "\n");
                slots[index] = CommandResult(unexpected(DeviceFailure{FailureKind::ProtocolError, {}, e.what()}));
            }
        }
    };

    const std::size_t workerCount = std::min(targets.size(), options_.maxInFlight);
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    ResultMap results;
    std::size_t skipped = 0;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        if (slots[i]) {
            results.emplace(targets[i], std::move(*slots[i]));
        } else {
            ++skipped;
            results.emplace(targets[i], CommandResult(unexpected(DeviceFailure{
                FailureKind::NotAttempted,
                std::make_error_code(std::errc::operation_canceled),
                "dispatch cancelled"})));
        }
    }

    if (skipped > 0) {
        logInfo("[CommandDispatcher] cancelled; ", skipped, " of ", targets.size(),
                " device(s) not contacted\n");
    }
    return results;
}

} // namespace bulbs::core
