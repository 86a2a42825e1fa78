#include "bulbs/bulb/BulbProtocol.hpp"

#include "bulbs/core/Error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>

namespace bulbs::bulb::protocol {

using nlohmann::json;

namespace {

std::error_code protocolError() {
    return core::make_error_code(core::errc::protocol_error);
}

} // namespace

std::string powerPath(bool on) {
    return std::string(STATUS_PATH) + (on ? "/on" : "/off");
}

std::string brightnessPath(core::Brightness brightness) {
    char text[16];
    std::snprintf(text, sizeof(text), "%.2f", brightness.fraction());
    return std::string(STATUS_PATH) + "/brightness/" + text;
}

std::string colorPath(const core::Rgb& color) {
    return std::string(STATUS_PATH) + "/color/" + color.toHex();
}

expected<core::DeviceState> decodeStatus(std::string_view body) {
    const json doc = json::parse(body.begin(), body.end(), nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return unexpected(protocolError());
    }

    core::DeviceState state;

    auto power = doc.find("on");
    if (power == doc.end()) {
        power = doc.find("enabled");
    }
    if (power == doc.end()) {
        return unexpected(protocolError());
    }
    if (power->is_boolean()) {
        state.power = power->get<bool>();
    } else if (power->is_number_integer()) {
        state.power = power->get<long long>() != 0;
    } else {
        return unexpected(protocolError());
    }

    auto brightness = doc.find("brightness");
    if (brightness == doc.end() || !brightness->is_number()) {
        return unexpected(protocolError());
    }
    auto level = core::Brightness::fromFraction(brightness->get<double>());
    if (!level) {
        return unexpected(protocolError());
    }
    state.brightness = *level;

    auto color = doc.find("color");
    if (color == doc.end() || !color->is_string()) {
        return unexpected(protocolError());
    }
    auto rgb = core::Rgb::parse(color->get<std::string>());
    if (!rgb) {
        return unexpected(protocolError());
    }
    state.color = *rgb;

    state.updatedAt = std::chrono::system_clock::now();
    return state;
}

std::string encodeStatus(const core::DeviceState& state) {
    const json doc = {
        {"brightness", state.brightness.fraction()},
        {"color", state.color.toString()},
        {"on", state.power ? 1 : 0},
    };
    return doc.dump();
}

} // namespace bulbs::bulb::protocol
