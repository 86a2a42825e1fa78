#include "bulbs/core/Command.hpp"

#include "bulbs/core/Error.hpp"

#include <sstream>

namespace bulbs::core {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string describe(const Operation& operation) {
    return std::visit(overloaded{
        [](const SetPower& op) { return std::string(op.on ? "power on" : "power off"); },
        [](const SetBrightness& op) {
            std::ostringstream os;
            os << "brightness " << op.value.value();
            return os.str();
        },
        [](const SetColor& op) { return "color " + op.value.toString(); },
        [](const Toggle&) { return std::string("toggle"); },
        [](const QueryStatus&) { return std::string("status"); },
    }, operation);
}

expected<Command> Command::make(Operation operation, std::set<DeviceAddress> targets) {
    if (targets.empty()) {
        return unexpected(make_error_code(errc::invalid_command));
    }
    return Command{std::move(operation), std::move(targets)};
}

} // namespace bulbs::core
