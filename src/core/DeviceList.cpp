#include "bulbs/core/DeviceList.hpp"

#include "bulbs/core/DeviceRegistry.hpp"
#include "bulbs/core/Error.hpp"
#include "bulbs/log/Log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace bulbs::core {

using nlohmann::json;

std::filesystem::path DeviceList::defaultPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "bulbs" / "bulbs.json";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "bulbs" / "bulbs.json";
    }
    return "bulbs.json";
}

expected<DeviceList> DeviceList::load(const std::filesystem::path& path) {
    DeviceList list;

    std::error_code fsEc;
    if (!std::filesystem::exists(path, fsEc)) {
        logDebug("[DeviceList] ", path.string(), " not found, starting empty\n");
        return list;
    }

    std::ifstream in(path);
    if (!in) {
        logError("[DeviceList] cannot open ", path.string(), "\n");
        return unexpected(make_error_code(errc::config_error));
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        logError("[DeviceList] ", path.string(), ": ", e.what(), "\n");
        return unexpected(make_error_code(errc::config_error));
    }

    if (!doc.is_object()) {
        logError("[DeviceList] ", path.string(), ": top level must be an object\n");
        return unexpected(make_error_code(errc::config_error));
    }
    auto bulbs = doc.find("bulbs");
    if (bulbs == doc.end()) {
        return list;
    }
    if (!bulbs->is_array()) {
        logError("[DeviceList] ", path.string(), ": \"bulbs\" must be an array\n");
        return unexpected(make_error_code(errc::config_error));
    }

    for (const auto& item : *bulbs) {
        if (!item.is_object() || !item.contains("ip") || !item["ip"].is_string()) {
            logError("[DeviceList] ", path.string(), ": every bulb needs a string \"ip\"\n");
            return unexpected(make_error_code(errc::config_error));
        }
        auto address = DeviceAddress::parse(item["ip"].get<std::string>());
        if (!address) {
            logError("[DeviceList] ", path.string(), ": bad address '",
                     item["ip"].get<std::string>(), "'\n");
            return unexpected(make_error_code(errc::config_error));
        }
        std::string name;
        if (auto it = item.find("name"); it != item.end() && it->is_string()) {
            name = it->get<std::string>();
        }
        list.add(std::move(*address), std::move(name));
    }
    return list;
}

expected<void> DeviceList::save(const std::filesystem::path& path) const {
    json bulbs = json::array();
    for (const auto& entry : entries_) {
        bulbs.push_back({{"ip", entry.address.toString()}, {"name", entry.name}});
    }
    const json doc = {{"bulbs", bulbs}};

    std::error_code fsEc;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), fsEc);
        if (fsEc) {
            logError("[DeviceList] cannot create ", path.parent_path().string(), ": ",
                     fsEc.message(), "\n");
            return unexpected(fsEc);
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        logError("[DeviceList] cannot write ", path.string(), "\n");
        return unexpected(make_error_code(errc::config_error));
    }
    out << doc.dump(2) << '\n';
    if (!out) {
        return unexpected(make_error_code(errc::config_error));
    }
    return {};
}

bool DeviceList::add(DeviceAddress address, std::string name) {
    const bool known = std::any_of(entries_.begin(), entries_.end(),
        [&](const DeviceEntry& e) { return e.address == address; });
    if (known) {
        return false;
    }
    entries_.push_back(DeviceEntry{std::move(address), std::move(name)});
    return true;
}

void DeviceList::registerAll(DeviceRegistry& registry) const {
    for (const auto& entry : entries_) {
        registry.add(entry.address, entry.name);
    }
}

} // namespace bulbs::core
