#pragma once

#include "bulbs/core/DeviceAddress.hpp"
#include "bulbs/core/DeviceState.hpp"
#include "bulbs/core/Expected.hpp"
#include "bulbs/core/Rgb.hpp"

#include <set>
#include <string>
#include <variant>

namespace bulbs::core {

struct SetPower { bool on = false; };
struct SetBrightness { Brightness value; };
struct SetColor { Rgb value; };
struct Toggle {};
struct QueryStatus {};

/// One operation kind. Payloads are validated when they are built.
using Operation = std::variant<SetPower, SetBrightness, SetColor, Toggle, QueryStatus>;

/// Short name used in logs and reports ("set-power", "query-status", ...).
std::string describe(const Operation& operation);

/**
 * @brief One operation aimed at a set of devices.
 *
 * The target set is a `std::set`, so duplicates collapse. `make()` refuses an
 * empty set; the dispatcher checks again because the struct can be filled by
 * hand.
 */
struct Command {
    Operation operation;
    std::set<DeviceAddress> targets;

    static expected<Command> make(Operation operation, std::set<DeviceAddress> targets);
};

} // namespace bulbs::core
