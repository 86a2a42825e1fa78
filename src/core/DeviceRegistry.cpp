#include "bulbs/core/DeviceRegistry.hpp"

#include "bulbs/log/Log.hpp"

namespace bulbs::core {

Device& DeviceRegistry::entryFor(const DeviceAddress& address) {
    auto it = devices.find(address);
    if (it == devices.end()) {
        it = devices.emplace(address, Device{address}).first;
    }
    return it->second;
}

bool DeviceRegistry::add(const DeviceAddress& address, std::string name) {
    std::lock_guard lock(entriesMutex);
    auto [it, inserted] = devices.emplace(address, Device{address, std::move(name)});
    return inserted;
}

void DeviceRegistry::upsert(const DeviceAddress& address, const DeviceState& state) {
    std::lock_guard lock(entriesMutex);
    auto& device = entryFor(address);
    device.state = state;
    device.health = Health::Reachable;
    device.consecutiveFailures = 0;
}

void DeviceRegistry::upsert(const DeviceAddress& address, Health health) {
    std::lock_guard lock(entriesMutex);
    entryFor(address).health = health;
}

void DeviceRegistry::apply(const ResultMap& results) {
    for (const auto& [address, result] : results) {
        if (result) {
            upsert(address, *result);
            continue;
        }

        const auto kind = result.error().kind;
        if (kind != FailureKind::Timeout && kind != FailureKind::ConnectionError) {
            continue;
        }

        std::lock_guard lock(entriesMutex);
        auto& device = entryFor(address);
        device.health = Health::Unreachable;
        ++device.consecutiveFailures;
        logDebug("[DeviceRegistry] ", address, " unreachable (",
                 device.consecutiveFailures, " in a row)\n");
    }
}

bool DeviceRegistry::remove(const DeviceAddress& address) {
    std::lock_guard lock(entriesMutex);
    return devices.erase(address) > 0;
}

std::optional<Device> DeviceRegistry::find(const DeviceAddress& address) const {
    std::lock_guard lock(entriesMutex);
    auto it = devices.find(address);
    if (it == devices.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Device> DeviceRegistry::snapshot() const {
    std::vector<Device> out;
    std::lock_guard lock(entriesMutex);
    out.reserve(devices.size());
    for (const auto& entry : devices) {
        out.push_back(entry.second);
    }
    return out;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard lock(entriesMutex);
    return devices.size();
}

} // namespace bulbs::core
