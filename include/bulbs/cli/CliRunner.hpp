#pragma once

#include "bulbs/cli/CliOptions.hpp"
#include "bulbs/core/AddressResolver.hpp"
#include "bulbs/core/CancellationToken.hpp"
#include "bulbs/core/CommandDispatcher.hpp"
#include "bulbs/core/DeviceRegistry.hpp"
#include "bulbs/core/DeviceTransport.hpp"
#include "bulbs/core/ResultAggregator.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <set>

namespace bulbs::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_DEVICE_FAILURE = 1;   // some Report was failure / partial_failure
constexpr int EXIT_USAGE = 2;            // bad arguments, no devices, resolver error

/**
 * @brief Executes one non-interactive `cli` invocation.
 *
 * Picks targets (explicit `-a`, else config file plus discovery), runs each
 * requested action as its own Command in the order brightness, color,
 * power, status, applies results to the registry and prints one block per
 * Report to @p out.
 *
 * `toggle` acts on the group: the targets' status is read first and every
 * target is switched to the opposite of the first reachable one, so a mixed
 * group ends up uniform.
 */
class CliRunner {
public:
    CliRunner(CliOptions options,
              std::shared_ptr<core::DeviceTransport> transport,
              core::AddressResolver resolver,
              std::ostream& out);

    int run(const core::CancellationToken& cancellation = core::CancellationToken{});

    const core::DeviceRegistry& registry() const { return registry_; }

private:
    int resolveTargets(std::set<core::DeviceAddress>& targets);
    core::Outcome runAction(const core::Operation& operation,
                            const std::set<core::DeviceAddress>& targets,
                            const core::CancellationToken& cancellation);
    std::optional<core::Operation> groupToggle(const std::set<core::DeviceAddress>& targets,
                                               const core::CancellationToken& cancellation);
    void printReport(const core::Report& report);
    void printStatus(const core::Report& report);
    void printDevices(const std::set<core::DeviceAddress>& targets);

    CliOptions options_;
    core::DeviceRegistry registry_;
    core::CommandDispatcher dispatcher_;
    core::AddressResolver resolver_;
    std::ostream& out_;
};

} // namespace bulbs::cli
