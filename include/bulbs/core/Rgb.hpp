#pragma once

#include "bulbs/core/Expected.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace bulbs::core {

struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    /// Accepts `#RRGGBB` or `RRGGBB` (hex digits in either case).
    static expected<Rgb> parse(std::string_view text);

    /// `#RRGGBB`, upper-case.
    std::string toString() const;

    /// `RRGGBB` as used in the device's color path.
    std::string toHex() const;

    friend bool operator==(const Rgb& a, const Rgb& b) {
        return a.r == b.r && a.g == b.g && a.b == b.b;
    }
    friend bool operator!=(const Rgb& a, const Rgb& b) { return !(a == b); }
};

std::ostream& operator<<(std::ostream& os, const Rgb& color);

} // namespace bulbs::core
