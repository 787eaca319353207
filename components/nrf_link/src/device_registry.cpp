/**
 * @file device_registry.cpp
 * @brief Paired-device table implementation.
 */

#include "device_registry.hpp"

#include "esp_log.h"
#include "esp_timer.h"

static const char* TAG = "DeviceRegistry";

int64_t linkNowMs()
{
    return esp_timer_get_time() / 1000;
}

DeviceRegistry::DeviceRegistry(const LinkConfig& cfg)
    : _cfg(cfg)
{
}

void DeviceRegistry::upsertOnPairing(DeviceId id, uint32_t pairingKey)
{
    const int64_t nowMs = linkNowMs();
    bool created = false;
    {
        LinkLockGuard lock(_mutex);
        auto it = _devices.find(id);
        if (it == _devices.end()) {
            it = _devices.emplace(id, Device::create(id, _cfg)).first;
            created = true;
        }
        it->second.pairingKey = pairingKey;
        it->second.paired     = true;
        it->second.touch(nowMs);
    }
    ESP_LOGI(TAG, "%s device 0x%08lX (key 0x%08lX)",
             created ? "Paired new" : "Re-paired",
             (unsigned long)id, (unsigned long)pairingKey);
}

bool DeviceRegistry::touch(DeviceId id)
{
    const int64_t nowMs = linkNowMs();
    LinkLockGuard lock(_mutex);
    auto it = _devices.find(id);
    if (it == _devices.end() || !it->second.paired) {
        return false;
    }
    it->second.touch(nowMs);
    return true;
}

size_t DeviceRegistry::evictStale(int64_t nowMs)
{
    std::vector<DeviceId> evicted;
    {
        LinkLockGuard lock(_mutex);
        for (auto it = _devices.begin(); it != _devices.end();) {
            if (nowMs - it->second.lastSeenMs > static_cast<int64_t>(_cfg.deviceTimeoutMs)) {
                it->second.paired = false;
                evicted.push_back(it->first);
                it = _devices.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (DeviceId id : evicted) {
        ESP_LOGI(TAG, "Device 0x%08lX timed out", (unsigned long)id);
    }
    return evicted.size();
}

std::vector<Device> DeviceRegistry::snapshot() const
{
    LinkLockGuard lock(_mutex);
    std::vector<Device> out;
    out.reserve(_devices.size());
    for (const auto& kv : _devices) {
        if (kv.second.paired) {
            out.push_back(kv.second);
        }
    }
    return out;
}

bool DeviceRegistry::find(DeviceId id, Device& out) const
{
    LinkLockGuard lock(_mutex);
    auto it = _devices.find(id);
    if (it == _devices.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool DeviceRegistry::isPaired(DeviceId id) const
{
    LinkLockGuard lock(_mutex);
    auto it = _devices.find(id);
    return it != _devices.end() && it->second.paired;
}

std::vector<DeviceId> DeviceRegistry::listIdentities() const
{
    LinkLockGuard lock(_mutex);
    std::vector<DeviceId> ids;
    ids.reserve(_devices.size());
    for (const auto& kv : _devices) {
        ids.push_back(kv.first);
    }
    return ids;
}

DeviceId DeviceRegistry::firstIdentity() const
{
    LinkLockGuard lock(_mutex);
    return _devices.empty() ? 0 : _devices.begin()->first;
}

bool DeviceRegistry::anyAlive(int64_t nowMs) const
{
    LinkLockGuard lock(_mutex);
    for (const auto& kv : _devices) {
        if (kv.second.isAlive(nowMs, _cfg.deviceTimeoutMs)) {
            return true;
        }
    }
    return false;
}

size_t DeviceRegistry::size() const
{
    LinkLockGuard lock(_mutex);
    return _devices.size();
}

#if CONFIG_NRF_LINK_ENABLE_TEST_SEAM

bool DeviceRegistry::setLastSeenForTest(DeviceId id, int64_t lastSeenMs)
{
    LinkLockGuard lock(_mutex);
    auto it = _devices.find(id);
    if (it == _devices.end()) {
        return false;
    }
    it->second.lastSeenMs = lastSeenMs;
    return true;
}

#endif // CONFIG_NRF_LINK_ENABLE_TEST_SEAM
