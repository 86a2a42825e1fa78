#include "bulbs/core/DeviceState.hpp"

#include "bulbs/core/Error.hpp"

#include <cmath>

namespace bulbs::core {

expected<Brightness> Brightness::make(int value) {
    if (value < 0 || value > config::BRIGHTNESS_MAX) {
        return unexpected(make_error_code(errc::invalid_command));
    }
    return Brightness(value);
}

expected<Brightness> Brightness::fromFraction(double fraction) {
    if (!std::isfinite(fraction) || fraction < 0.0 || fraction > 1.0) {
        return unexpected(make_error_code(errc::protocol_error));
    }
    return Brightness(static_cast<int>(std::lround(fraction * config::BRIGHTNESS_MAX)));
}

const char* toString(Health health) {
    switch (health) {
        case Health::Unknown:     return "unknown";
        case Health::Reachable:   return "reachable";
        case Health::Unreachable: return "unreachable";
    }
    return "unknown";
}

} // namespace bulbs::core
