#pragma once

/**
 * @file loopback_radio.hpp
 * @brief In-memory IRadioDriver for host builds and integration tests.
 *
 * @details
 * A LoopbackMedium stands for the air.  Every LoopbackRadio attached to it
 * receives the frames transmitted by the other radios tuned to the same
 * channel; a radio never hears itself.  Each radio buffers inbound frames in
 * a bounded FreeRTOS queue and drops frames that do not fit, like a receiver
 * that is not keeping up.
 *
 * @verbatim
 *   LoopbackMedium medium;
 *   auto tx = std::make_unique<LoopbackRadio>(medium);
 *   auto rx = std::make_unique<LoopbackRadio>(medium);
 * @endverbatim
 *
 * The medium must outlive every radio attached to it.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

#include "frame_codec.hpp"
#include "link_mutex.hpp"
#include "nrf_link_config.hpp"
#include "radio_driver.hpp"

class LoopbackRadio;

class LoopbackMedium {
public:
    LoopbackMedium() = default;

    LoopbackMedium(const LoopbackMedium&)            = delete;
    LoopbackMedium& operator=(const LoopbackMedium&) = delete;

    void attach(LoopbackRadio* radio);
    void detach(LoopbackRadio* radio);

    /// Deliver @p data to every other attached radio on @p channel.
    /// @return Number of radios the frame was queued to.
    size_t broadcast(const LoopbackRadio* from, uint8_t channel,
                     const uint8_t* data, size_t len);

    size_t radioCount() const;

private:
    mutable LinkMutex           _mutex;
    std::vector<LoopbackRadio*> _radios;
};

class LoopbackRadio final : public IRadioDriver {
public:
    /// Attaches to @p medium; detaches in the destructor.
    explicit LoopbackRadio(LoopbackMedium& medium,
                           uint8_t channel = CONFIG_NRF_LINK_DEFAULT_CHANNEL,
                           size_t queueDepth = CONFIG_NRF_LINK_LOOPBACK_QUEUE_DEPTH);
    ~LoopbackRadio() override;

    LoopbackRadio(const LoopbackRadio&)            = delete;
    LoopbackRadio& operator=(const LoopbackRadio&) = delete;

    // IRadioDriver
    void      startClock() override;
    esp_err_t configure(uint32_t address, uint8_t prefix, uint8_t channel) override;
    esp_err_t setChannel(uint8_t channel) override;
    esp_err_t transmit(const uint8_t* data, size_t len) override;
    esp_err_t receive(uint8_t* data, size_t capacity,
                      size_t& outLen, uint32_t timeoutMs) override;

    uint8_t  channel() const     { return _channel; }
    bool     clockStarted() const { return _clockStarted; }

    /// Frames dropped because this radio's queue was full.
    uint32_t droppedCount() const { return _dropped; }

private:
    friend class LoopbackMedium;

    struct RxItem {
        uint8_t buf[NRF_MAX_FRAME_SIZE];
        uint8_t len;
    };

    /// Called by the medium with its mutex held.  Never blocks.
    bool enqueue(const uint8_t* data, size_t len);

    LoopbackMedium&    _medium;
    QueueHandle_t      _rxQueue;
    volatile uint8_t   _channel;
    bool               _clockStarted = false;
    uint32_t           _address      = 0;
    uint8_t            _prefix       = 0;
    volatile uint32_t  _dropped      = 0;
};
