#pragma once

/**
 * @file radio_transmitter.hpp
 * @brief Transmitting endpoint of an nrf_link: pairing, data and heartbeats.
 *
 * @details
 * A RadioTransmitter pairs with exactly one receiver identity and then sends
 * Data and Heartbeat frames to it.  The send path:
 * @verbatim
 *  application ──► sendData / sendDataReliable / sendHeartbeat
 *                       │  next sequence number, encodeFrame()
 *                       ▼
 *                 IRadioDriver::transmit()
 * @endverbatim
 * Handshake (transmitter side): a Pairing frame carrying
 * { pairingKey(4, LE) | receiverId(4, LE) } is sent, then the driver is polled
 * until an Ack echoing the Pairing frame's sequence arrives with the expected
 * receiver identity as payload.
 *
 * sendDataReliable() reuses one sequence number for every retry so the
 * receiver's Ack can be matched to any of the attempts.
 *
 * The sequence counter and paired flag are atomic, so the heartbeat task and
 * application calls can run concurrently.  Configuration calls (init,
 * setChannel, startPairing) are expected from one application task.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "esp_err.h"

#include "device.hpp"
#include "frame_codec.hpp"
#include "link_task.hpp"
#include "nrf_link_config.hpp"
#include "radio_driver.hpp"

class RadioTransmitter {
public:
    /// @brief Construct a transmitter and generate its pairing key.
    /// @param id      This endpoint's identity.
    /// @param driver  Radio driver; ownership is taken.
    /// @param cfg     Addressing, timing and task configuration.
    RadioTransmitter(DeviceId id,
                     std::unique_ptr<IRadioDriver> driver,
                     const LinkConfig& cfg = LinkConfig{});

    /// RAII destructor: stops the heartbeat task.
    ~RadioTransmitter();

    RadioTransmitter(const RadioTransmitter&)            = delete;
    RadioTransmitter& operator=(const RadioTransmitter&) = delete;

    // -----------------------------------------------------------------------
    // Lifecycle
    // -----------------------------------------------------------------------

    /// Start the radio clock and apply address / prefix / channel.
    /// @return ESP_OK | ESP_ERR_INVALID_ARG | driver error
    esp_err_t init();

    /// @return ESP_OK | ESP_ERR_INVALID_ARG (channel > NRF_MAX_CHANNEL) | driver error
    esp_err_t setChannel(uint8_t channel);

    // -----------------------------------------------------------------------
    // Send path
    // -----------------------------------------------------------------------

    /// Send one frame with the next sequence number.
    /// @return ESP_OK | ESP_ERR_INVALID_STATE (not paired, type != Pairing)
    ///       | ESP_ERR_INVALID_SIZE (len > NRF_MAX_PAYLOAD) | driver error
    esp_err_t sendFrame(FrameType type, const uint8_t* payload, size_t len);

    /// Pair with @p receiverId.  Blocks until the matching Ack arrives or
    /// pairingTimeoutMs passes.
    /// @return ESP_OK | ESP_ERR_TIMEOUT | driver error
    esp_err_t startPairing(DeviceId receiverId);

    /// @return ESP_OK | ESP_ERR_INVALID_STATE | driver error
    esp_err_t sendHeartbeat();

    /// Fire-and-forget Data frame.
    /// @return ESP_OK | ESP_ERR_INVALID_STATE | ESP_ERR_INVALID_SIZE | driver error
    esp_err_t sendData(const uint8_t* data, size_t len);

    /// Data frame with Ack and up to @p maxRetries transmissions.
    /// @return ESP_OK | ESP_ERR_INVALID_STATE | ESP_ERR_INVALID_SIZE
    ///       | ESP_ERR_TIMEOUT (no Ack after maxRetries attempts) | driver error
    esp_err_t sendDataReliable(const uint8_t* data, size_t len, uint32_t maxRetries);

    /// One receive attempt.
    /// @return true if a valid frame was decoded into @p out.
    bool receiveFrame(uint32_t timeoutMs, Frame& out);

    // -----------------------------------------------------------------------
    // Heartbeat task
    // -----------------------------------------------------------------------

    /// Send a heartbeat every heartbeatIntervalMs until stopped or destroyed.
    /// @return ESP_OK | ESP_ERR_NO_MEM
    esp_err_t startHeartbeatTask();

    /// Stop the heartbeat task and wait for it to exit.
    void stopHeartbeatTask();

    // -----------------------------------------------------------------------
    // State queries
    // -----------------------------------------------------------------------

    DeviceId id() const               { return _self.id; }
    uint32_t pairingKey() const       { return _pairingKey; }
    bool     isPaired() const         { return _paired.load(); }
    DeviceId pairedReceiver() const   { return _receiver.load(); }
    uint32_t nextSequence() const     { return _seq.load(); }
    uint8_t  channel() const          { return _self.channel; }

    /// Copy of this endpoint's own Device entry.
    Device   device() const;

private:
    /// Encode and transmit with an explicit sequence number.
    esp_err_t transmitFrame(FrameType type, uint32_t seq,
                            const uint8_t* payload, size_t len);

    LinkConfig                    _cfg;
    std::unique_ptr<IRadioDriver> _driver;
    Device                        _self;
    uint32_t                      _pairingKey;

    std::atomic<uint32_t>         _seq{0};
    std::atomic<bool>             _paired{false};
    std::atomic<DeviceId>         _receiver{0};

    LinkTask                      _heartbeatTask;
};
