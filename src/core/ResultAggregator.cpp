#include "bulbs/core/ResultAggregator.hpp"

#include <algorithm>

namespace bulbs::core {

const char* toString(Outcome outcome) {
    switch (outcome) {
        case Outcome::Success:        return "success";
        case Outcome::PartialFailure: return "partial_failure";
        case Outcome::Failure:        return "failure";
    }
    return "failure";
}

std::size_t Report::succeeded() const {
    return static_cast<std::size_t>(std::count_if(details.begin(), details.end(),
        [](const auto& entry) { return entry.second.has_value(); }));
}

std::size_t Report::failed() const {
    return details.size() - succeeded();
}

Report aggregate(const Command& command, const ResultMap& results) {
    Report report{command.operation, Outcome::Failure, {}};

    // Only targets are reported; stray entries in @p results are ignored.
    std::size_t ok = 0;
    for (const auto& target : command.targets) {
        auto it = results.find(target);
        if (it == results.end()) {
            report.details.emplace(target, CommandResult(unexpected(DeviceFailure{
                FailureKind::NotAttempted, {}, "no result recorded"})));
            continue;
        }
        report.details.emplace(target, it->second);
        if (it->second) {
            ++ok;
        }
    }

    if (!command.targets.empty() && ok == command.targets.size()) {
        report.overall = Outcome::Success;
    } else if (ok > 0) {
        report.overall = Outcome::PartialFailure;
    }
    return report;
}

} // namespace bulbs::core
