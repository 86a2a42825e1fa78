#include "bulbs/core/Rgb.hpp"

#include "bulbs/core/Error.hpp"

#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace bulbs::core {

namespace {

bool parseHexByte(std::string_view text, std::uint8_t& out) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return false;
    }
    out = static_cast<std::uint8_t>(value);
    return true;
}

} // namespace

expected<Rgb> Rgb::parse(std::string_view text) {
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    if (text.size() != 6) {
        return unexpected(make_error_code(errc::invalid_command));
    }
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return unexpected(make_error_code(errc::invalid_command));
        }
    }

    Rgb color;
    if (!parseHexByte(text.substr(0, 2), color.r) ||
        !parseHexByte(text.substr(2, 2), color.g) ||
        !parseHexByte(text.substr(4, 2), color.b)) {
        return unexpected(make_error_code(errc::invalid_command));
    }
    return color;
}

std::string Rgb::toHex() const {
    std::ostringstream os;
    os << std::hex << std::uppercase << std::setfill('0')
       << std::setw(2) << static_cast<int>(r)
       << std::setw(2) << static_cast<int>(g)
       << std::setw(2) << static_cast<int>(b);
    return os.str();
}

std::string Rgb::toString() const {
    return "#" + toHex();
}

std::ostream& operator<<(std::ostream& os, const Rgb& color) {
    return os << color.toString();
}

} // namespace bulbs::core
