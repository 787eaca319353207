#pragma once

/**
 * @file device.hpp
 * @brief One pairing-table entry: identity, radio addressing and liveness.
 */

#include <cstdint>

#include "frame_codec.hpp"
#include "nrf_link_config.hpp"

/// @brief Milliseconds on the monotonic esp_timer clock.
int64_t linkNowMs();

/**
 * @brief A transmitter or receiver endpoint as seen by the link layer.
 *
 * A Device with @c paired == false must not be used for data exchange.
 */
struct Device {
    DeviceId id         = 0;
    uint32_t address    = CONFIG_NRF_LINK_DEFAULT_ADDRESS;
    uint8_t  prefix     = CONFIG_NRF_LINK_DEFAULT_PREFIX;
    uint8_t  channel    = CONFIG_NRF_LINK_DEFAULT_CHANNEL;
    uint32_t pairingKey = 0;
    bool     paired     = false;
    int64_t  lastSeenMs = 0;   ///< linkNowMs() at the last accepted frame

    /// @brief Fresh entry for @p deviceId with addressing taken from @p cfg.
    static Device create(DeviceId deviceId, const LinkConfig& cfg = LinkConfig{})
    {
        Device d;
        d.id         = deviceId;
        d.address    = cfg.address;
        d.prefix     = cfg.prefix;
        d.channel    = cfg.channel;
        d.lastSeenMs = linkNowMs();
        return d;
    }

    void touch(int64_t nowMs) { lastSeenMs = nowMs; }

    /// @brief true while less than @p timeoutMs has passed since lastSeenMs.
    bool isAlive(int64_t nowMs, uint32_t timeoutMs) const
    {
        return (nowMs - lastSeenMs) < static_cast<int64_t>(timeoutMs);
    }
};
