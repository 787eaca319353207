#pragma once

/**
 * @file radio_driver.hpp
 * @brief Abstract interface for the 2.4 GHz radio hardware.
 *
 * @details
 * Decouples RadioTransmitter / RadioReceiver from the concrete radio.  The
 * hardware-backed driver (clock start-up, frequency, address and CRC
 * registers, packet DMA) lives outside this component; host builds and tests
 * use LoopbackRadio or a mock.  All implementations share the same contract:
 *  - transmit() blocks until the frame is on air.
 *  - receive() blocks at most @p timeoutMs and reports ESP_ERR_TIMEOUT when
 *    nothing arrived.
 *  - Channel arguments outside 0..NRF_MAX_CHANNEL yield ESP_ERR_INVALID_ARG.
 */

#include <cstdint>
#include <cstddef>

#include "esp_err.h"

/**
 * @brief Pure-virtual radio capability consumed by the link layer.
 *
 * A driver instance is owned by exactly one endpoint but may be called from
 * that endpoint's background tasks and the application task concurrently;
 * implementations must tolerate a concurrent transmit() and receive().
 */
class IRadioDriver {
public:
    virtual ~IRadioDriver() = default;

    /// @brief Bring the radio timing source up.  Assumed to eventually succeed.
    virtual void startClock() = 0;

    /// @brief One-time radio setup.
    /// @param address  Base address shared by both ends of the link.
    /// @param prefix   Address prefix byte.
    /// @param channel  RF channel, 0..NRF_MAX_CHANNEL.
    /// @return ESP_OK | ESP_ERR_INVALID_ARG (channel out of range)
    virtual esp_err_t configure(uint32_t address, uint8_t prefix, uint8_t channel) = 0;

    /// @brief Retune to another channel.
    /// @return ESP_OK | ESP_ERR_INVALID_ARG (channel out of range)
    virtual esp_err_t setChannel(uint8_t channel) = 0;

    /// @brief Send one frame's worth of bytes, blocking until on-air completion.
    /// @return ESP_OK or a driver-specific error code.
    virtual esp_err_t transmit(const uint8_t* data, size_t len) = 0;

    /// @brief Wait up to @p timeoutMs for one inbound frame.
    /// @param data      Output buffer.
    /// @param capacity  Size of @p data in bytes.
    /// @param outLen    Receives the number of bytes written on success.
    /// @param timeoutMs Maximum wait.
    /// @return ESP_OK | ESP_ERR_TIMEOUT | driver-specific error code.
    virtual esp_err_t receive(uint8_t* data, size_t capacity,
                              size_t& outLen, uint32_t timeoutMs) = 0;
};
