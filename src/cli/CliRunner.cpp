#include "bulbs/cli/CliRunner.hpp"

#include "bulbs/core/DeviceList.hpp"
#include "bulbs/log/Log.hpp"

#include <iomanip>
#include <optional>
#include <vector>

namespace bulbs::cli {

namespace {

core::CommandDispatcher::Options dispatchOptions(const CliOptions& options) {
    core::CommandDispatcher::Options dispatch;
    if (options.timeout) {
        dispatch.requestTimeout = *options.timeout;
    }
    return dispatch;
}

void printStateLine(std::ostream& out, const core::Device& device) {
    out << std::left << std::setw(21) << device.address.toString() << ' '
        << std::setw(16) << device.name << ' ';
    if (!device.state) {
        out << toString(device.health) << '\n';
        return;
    }
    const auto& state = *device.state;
    out << std::setw(3) << (state.power ? "ON" : "OFF") << ' '
        << std::right << std::setw(3) << state.brightness.value() << "% "
        << state.color << std::left << '\n';
}

} // namespace

CliRunner::CliRunner(CliOptions options,
                     std::shared_ptr<core::DeviceTransport> transport,
                     core::AddressResolver resolver,
                     std::ostream& out)
: options_(std::move(options))
, dispatcher_(std::move(transport), dispatchOptions(options_))
, resolver_(std::move(resolver))
, out_(out)
{}

int CliRunner::resolveTargets(std::set<core::DeviceAddress>& targets) {
    if (!options_.addresses.empty()) {
        for (const auto& address : options_.addresses) {
            registry_.add(address);
            targets.insert(address);
        }
    } else {
        auto list = core::DeviceList::load(options_.configPath);
        if (list) {
            list->registerAll(registry_);
            for (const auto& entry : list->entries()) {
                targets.insert(entry.address);
            }
        } else {
            logError("[cli] ignoring device list ", options_.configPath.string(), ": ",
                     list.error().message(), "\n");
        }
    }

    if (!options_.discover) {
        return EXIT_OK;
    }

    auto found = resolver_.discover();
    if (!found) {
        logError("error: discovery failed: ", found.error().message(), "\n");
        return EXIT_USAGE;
    }
    logInfo("[cli] discovery found ", found->size(), " device(s)\n");

    std::size_t added = 0;
    core::DeviceList saved;
    if (options_.save) {
        if (auto existing = core::DeviceList::load(options_.configPath)) {
            saved = std::move(*existing);
        }
    }
    for (const auto& address : *found) {
        registry_.add(address);
        if (options_.addresses.empty()) {
            targets.insert(address);
        }
        if (options_.save && saved.add(address)) {
            ++added;
        }
    }

    if (options_.save && added > 0) {
        if (auto written = saved.save(options_.configPath); !written) {
            logError("error: could not save ", options_.configPath.string(), ": ",
                     written.error().message(), "\n");
            return EXIT_USAGE;
        }
        logInfo("[cli] saved ", added, " new device(s) to ", options_.configPath.string(), "\n");
    }
    return EXIT_OK;
}

core::Outcome CliRunner::runAction(const core::Operation& operation,
                                   const std::set<core::DeviceAddress>& targets,
                                   const core::CancellationToken& cancellation) {
    auto command = core::Command::make(operation, targets);
    if (!command) {
        return core::Outcome::Failure;
    }
    auto results = dispatcher_.dispatch(*command, cancellation);
    if (!results) {
        logError("error: ", results.error().message(), "\n");
        return core::Outcome::Failure;
    }

    // Results from devices that answered stay valid even if the run was cancelled.
    registry_.apply(*results);

    const auto report = core::aggregate(*command, *results);
    if (std::holds_alternative<core::QueryStatus>(operation)) {
        printStatus(report);
    } else {
        printReport(report);
    }
    return report.overall;
}

std::optional<core::Operation>
CliRunner::groupToggle(const std::set<core::DeviceAddress>& targets,
                       const core::CancellationToken& cancellation) {
    auto command = core::Command::make(core::QueryStatus{}, targets);
    if (!command) {
        return std::nullopt;
    }
    auto results = dispatcher_.dispatch(*command, cancellation);
    if (!results) {
        logError("error: ", results.error().message(), "\n");
        return std::nullopt;
    }
    registry_.apply(*results);

    // The first reachable target in address order decides for the group.
    for (const auto& target : targets) {
        auto it = results->find(target);
        if (it != results->end() && it->second) {
            const bool on = !it->second->power;
            logDebug("[cli] toggle follows ", target, ", switching group ", on ? "on" : "off", "\n");
            return core::Operation{core::SetPower{on}};
        }
    }

    auto report = core::aggregate(*command, *results);
    report.operation = core::Toggle{};
    printReport(report);
    return std::nullopt;
}

void CliRunner::printReport(const core::Report& report) {
    out_ << core::describe(report.operation) << ": " << toString(report.overall)
        << " (" << report.succeeded() << '/' << report.details.size() << ")\n";
    for (const auto& [address, result] : report.details) {
        if (!result) {
            out_ << "  " << std::left << std::setw(21) << address.toString() << ' '
                << result.error().describe() << '\n';
        }
    }
}

void CliRunner::printStatus(const core::Report& report) {
    for (const auto& [address, result] : report.details) {
        if (result) {
            if (auto device = registry_.find(address)) {
                printStateLine(out_, *device);
            }
        } else {
            out_ << std::left << std::setw(21) << address.toString() << ' '
                << result.error().describe() << '\n';
        }
    }
}

void CliRunner::printDevices(const std::set<core::DeviceAddress>& targets) {
    for (const auto& device : registry_.snapshot()) {
        if (targets.count(device.address)) {
            printStateLine(out_, device);
        }
    }
}

int CliRunner::run(const core::CancellationToken& cancellation) {
    setVerboseLogging(options_.verbose || log::verboseLogging());

    std::set<core::DeviceAddress> targets;
    if (int rc = resolveTargets(targets); rc != EXIT_OK) {
        return rc;
    }

    if (targets.empty()) {
        logError("error: no devices found, provide at least one device address\n");
        return EXIT_USAGE;
    }

    if (!options_.hasAction()) {
        if (options_.discover) {
            printDevices(targets);
            return EXIT_OK;
        }
        logError("error: nothing to do, provide argument or option that does something\n");
        return EXIT_USAGE;
    }

    std::vector<core::Operation> actions;
    if (options_.brightness) actions.emplace_back(core::SetBrightness{*options_.brightness});
    if (options_.color) actions.emplace_back(core::SetColor{*options_.color});
    if (options_.power) {
        switch (*options_.power) {
            case PowerAction::On:     actions.emplace_back(core::SetPower{true}); break;
            case PowerAction::Off:    actions.emplace_back(core::SetPower{false}); break;
            case PowerAction::Toggle: actions.emplace_back(core::Toggle{}); break;
        }
    }
    if (options_.status) actions.emplace_back(core::QueryStatus{});

    int rc = EXIT_OK;
    for (const auto& operation : actions) {
        if (cancellation.cancelled()) {
            logError("[cli] cancelled before ", core::describe(operation), "\n");
            return EXIT_DEVICE_FAILURE;
        }
        core::Operation effective = operation;
        if (std::holds_alternative<core::Toggle>(operation)) {
            auto power = groupToggle(targets, cancellation);
            if (!power) {
                rc = EXIT_DEVICE_FAILURE;
                continue;
            }
            effective = *power;
        }
        if (runAction(effective, targets, cancellation) != core::Outcome::Success) {
            rc = EXIT_DEVICE_FAILURE;
        }
    }
    return rc;
}

} // namespace bulbs::cli
