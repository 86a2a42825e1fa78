#pragma once

#include "bulbs/core/Command.hpp"
#include "bulbs/core/CommandResult.hpp"

#include <cstddef>

namespace bulbs::core {

enum class Outcome {
    Success,
    PartialFailure,
    Failure
};

const char* toString(Outcome outcome);

/// Aggregated outcome of one Command, with every target's individual result.
struct Report {
    Operation operation;
    Outcome overall = Outcome::Failure;
    ResultMap details;

    std::size_t succeeded() const;
    std::size_t failed() const;
};

/**
 * @brief Merge per-device results into a Report. Pure: no I/O, no state.
 *
 * - Success iff every target succeeded.
 * - PartialFailure if some but not all did; Failure if none did.
 * - Target results are copied verbatim; a target with no result is listed
 *   as NotAttempted rather than dropped. Entries for non-targets are left out.
 */
Report aggregate(const Command& command, const ResultMap& results);

} // namespace bulbs::core
