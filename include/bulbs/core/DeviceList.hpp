#pragma once

#include "bulbs/core/DeviceAddress.hpp"
#include "bulbs/core/Expected.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace bulbs::core {

class DeviceRegistry;

/// One configured bulb: where it lives and what the operator calls it.
struct DeviceEntry {
    DeviceAddress address;
    std::string name;
};

/**
 * @brief The operator's saved device list.
 *
 * Stored as JSON: `{"bulbs": [{"ip": "192.168.1.20", "name": "desk"}]}`.
 * `ip` accepts anything `DeviceAddress::parse` accepts, including `host:port`.
 */
class DeviceList {
public:
    /// `$XDG_CONFIG_HOME/bulbs/bulbs.json`, `$HOME/.config/bulbs/bulbs.json`, or `bulbs.json`.
    static std::filesystem::path defaultPath();

    /// A missing file yields an empty list; unreadable or malformed files yield errc::config_error.
    static expected<DeviceList> load(const std::filesystem::path& path);

    /// Write pretty-printed JSON, creating the parent directory if needed.
    expected<void> save(const std::filesystem::path& path) const;

    /// Add an entry unless the address is already listed. Returns true if added.
    bool add(DeviceAddress address, std::string name = {});

    /// Copy every entry into @p registry with unknown health.
    void registerAll(DeviceRegistry& registry) const;

    const std::vector<DeviceEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<DeviceEntry> entries_;
};

} // namespace bulbs::core
