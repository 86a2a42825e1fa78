#pragma once

#include "bulbs/core/BulbsConfig.hpp"
#include "bulbs/core/DeviceAddress.hpp"
#include "bulbs/core/Expected.hpp"
#include "bulbs/core/Rgb.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace bulbs::core {

/**
 * @brief Brightness in the range [0, config::BRIGHTNESS_MAX].
 *
 * Only `make()` can produce a value, so an out-of-range brightness never
 * reaches the dispatcher.
 */
class Brightness {
public:
    Brightness() = default; // zero

    static expected<Brightness> make(int value);

    /// Map a device fraction (0..1) onto the integer scale. Out-of-range fails.
    static expected<Brightness> fromFraction(double fraction);

    int value() const { return value_; }
    double fraction() const { return static_cast<double>(value_) / config::BRIGHTNESS_MAX; }

    friend bool operator==(Brightness a, Brightness b) { return a.value_ == b.value_; }
    friend bool operator!=(Brightness a, Brightness b) { return a.value_ != b.value_; }

private:
    explicit Brightness(int value) : value_(value) {}
    int value_ = 0;
};

/// Last state a device reported. Built only from device responses.
struct DeviceState {
    bool power = false;
    Brightness brightness{};
    Rgb color{};
    std::chrono::system_clock::time_point updatedAt{};
};

enum class Health {
    Unknown,
    Reachable,
    Unreachable
};

const char* toString(Health health);

/// Registry entry. Consumers only ever see copies.
struct Device {
    DeviceAddress address;
    std::string name;
    std::optional<DeviceState> state;
    Health health = Health::Unknown;
    unsigned consecutiveFailures = 0;
};

} // namespace bulbs::core
