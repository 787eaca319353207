#pragma once

/**
 * @file device_registry.hpp
 * @brief Thread-safe table of paired peer devices with timeout eviction.
 *
 * @details
 * Owned by RadioReceiver.  Accessed concurrently by the receive-polling task,
 * the cleanup task and application calls.  Every method takes the internal
 * mutex for the duration of the map access only and returns copies, so no
 * caller ever holds a reference into the table.
 */

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "device.hpp"
#include "link_mutex.hpp"
#include "nrf_link_config.hpp"

class DeviceRegistry {
public:
    explicit DeviceRegistry(const LinkConfig& cfg = LinkConfig{});

    DeviceRegistry(const DeviceRegistry&)            = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /// Create the entry if absent, then mark it paired with @p pairingKey and
    /// refresh its timestamp.
    void upsertOnPairing(DeviceId id, uint32_t pairingKey);

    /// Refresh lastSeen of a paired entry.
    /// @return true if @p id was present and paired.
    bool touch(DeviceId id);

    /// Remove every entry with nowMs - lastSeenMs > deviceTimeoutMs.
    /// @return Number of entries removed.
    size_t evictStale(int64_t nowMs);

    /// Copies of all paired entries.
    std::vector<Device> snapshot() const;

    /// Copy of a single entry.
    /// @return true if @p id is in the table.
    bool find(DeviceId id, Device& out) const;

    bool isPaired(DeviceId id) const;

    std::vector<DeviceId> listIdentities() const;

    /// Some identity in the table, 0 when empty.
    DeviceId firstIdentity() const;

    /// true if at least one entry was seen within deviceTimeoutMs of @p nowMs.
    bool anyAlive(int64_t nowMs) const;

    size_t size() const;
    bool   empty() const { return size() == 0; }

#if CONFIG_NRF_LINK_ENABLE_TEST_SEAM
    /// Overwrite the timestamp of an entry so eviction can be tested without
    /// waiting for DeviceTimeout.
    bool setLastSeenForTest(DeviceId id, int64_t lastSeenMs);
#endif

private:
    LinkConfig                             _cfg;
    mutable LinkMutex                      _mutex;
    std::unordered_map<DeviceId, Device>   _devices;
};
