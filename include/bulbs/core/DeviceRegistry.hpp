#pragma once

#include "bulbs/core/CommandResult.hpp"
#include "bulbs/core/DeviceAddress.hpp"
#include "bulbs/core/DeviceState.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bulbs::core {

/**
 * @brief Known devices and their last observed state.
 *
 * Thread-safe: every call takes one internal mutex for the duration of a
 * single map operation or copy, so callers never lock anything themselves and
 * never observe a half-written Device. Entries are keyed by address, so an
 * address appears at most once.
 */
class DeviceRegistry {
public:
    DeviceRegistry() = default;

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /// Insert an entry with unknown health. Returns false if the address exists.
    bool add(const DeviceAddress& address, std::string name = {});

    /// Record a confirmed state; marks the device reachable.
    void upsert(const DeviceAddress& address, const DeviceState& state);

    /// Update health only; the last state (if any) is kept.
    void upsert(const DeviceAddress& address, Health health);

    /**
     * @brief Fold dispatch results in, one entry at a time.
     *
     * Successes become states. Timeouts and connection errors mark the device
     * unreachable and bump its failure count. Protocol errors and requests
     * that were never issued leave health alone.
     */
    void apply(const ResultMap& results);

    bool remove(const DeviceAddress& address);

    std::optional<Device> find(const DeviceAddress& address) const;

    /// Copy of every entry, sorted by address.
    std::vector<Device> snapshot() const;

    std::size_t size() const;

private:
    Device& entryFor(const DeviceAddress& address);  // caller holds mutex

    mutable std::mutex entriesMutex;
    std::map<DeviceAddress, Device> devices;
};

} // namespace bulbs::core
