/**
 * @file radio_transmitter.cpp
 * @brief Transmitter side of the nrf_link protocol.
 *
 * @details
 * Implementation notes:
 *  - Every blocking wait (pairing, Ack window) is a deadline computed from
 *    linkNowMs() at operation start; the driver is polled in slices of
 *    rxPollTimeoutMs / ackPollMs so no call blocks indefinitely.
 *  - Frames that fail to decode, and frames that do not match what we wait
 *    for, are dropped without surfacing an error.
 */

#include "radio_transmitter.hpp"
#include "pairing_key.hpp"

#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <utility>

static const char* TAG = "RadioTransmitter";

// Back-off after a receive error that returned immediately.
static constexpr uint32_t RX_ERROR_BACKOFF_MS = 10;

// ===========================================================================
// Constructor / Destructor
// ===========================================================================

RadioTransmitter::RadioTransmitter(DeviceId id,
                                   std::unique_ptr<IRadioDriver> driver,
                                   const LinkConfig& cfg)
    : _cfg(cfg),
      _driver(std::move(driver)),
      _self(Device::create(id, cfg)),
      _pairingKey(generatePairingKey()),
      _heartbeatTask("nrf_tx_hb", cfg.heartbeatIntervalMs, cfg.taskStackSize, cfg.taskPriority)
{
    _self.pairingKey = _pairingKey;
}

RadioTransmitter::~RadioTransmitter()
{
    _heartbeatTask.stop();
}

// ===========================================================================
// Lifecycle
// ===========================================================================

esp_err_t RadioTransmitter::init()
{
    _driver->startClock();
    esp_err_t err = _driver->configure(_self.address, _self.prefix, _self.channel);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "configure() failed: %s", esp_err_to_name(err));
        return err;
    }
    ESP_LOGI(TAG, "Transmitter 0x%08lX ready on channel %u",
             (unsigned long)_self.id, _self.channel);
    return ESP_OK;
}

esp_err_t RadioTransmitter::setChannel(uint8_t channel)
{
    if (channel > NRF_MAX_CHANNEL) {
        ESP_LOGW(TAG, "setChannel(): invalid channel %u", channel);
        return ESP_ERR_INVALID_ARG;
    }
    _self.channel = channel;
    return _driver->setChannel(channel);
}

Device RadioTransmitter::device() const
{
    Device d  = _self;
    d.paired  = _paired.load();
    return d;
}

// ===========================================================================
// Send path
// ===========================================================================

esp_err_t RadioTransmitter::transmitFrame(FrameType type, uint32_t seq,
                                          const uint8_t* payload, size_t len)
{
    Frame frame;
    frame.senderId = _self.id;
    frame.type     = type;
    frame.sequence = seq;
    if (payload && len > 0) {
        frame.payload.assign(payload, payload + len);
    }

    uint8_t buf[NRF_MAX_FRAME_SIZE];
    const size_t frameLen = encodeFrame(frame, buf);

    esp_err_t err = _driver->transmit(buf, frameLen);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "TX %s seq=%lu failed: %s", frameTypeName(type),
                 (unsigned long)seq, esp_err_to_name(err));
        return err;
    }
    ESP_LOGD(TAG, "TX %s seq=%lu len=%zu", frameTypeName(type), (unsigned long)seq, len);
    return ESP_OK;
}

esp_err_t RadioTransmitter::sendFrame(FrameType type, const uint8_t* payload, size_t len)
{
    if (!_paired.load() && type != FrameType::Pairing) {
        return ESP_ERR_INVALID_STATE;
    }
    if (len > NRF_MAX_PAYLOAD) {
        ESP_LOGW(TAG, "sendFrame(): payload too large (%zu > %zu)", len, NRF_MAX_PAYLOAD);
        return ESP_ERR_INVALID_SIZE;
    }

    const uint32_t seq = _seq.fetch_add(1);
    return transmitFrame(type, seq, payload, len);
}

bool RadioTransmitter::receiveFrame(uint32_t timeoutMs, Frame& out)
{
    uint8_t buf[NRF_MAX_FRAME_SIZE];
    size_t  len = 0;

    esp_err_t err = _driver->receive(buf, sizeof(buf), len, timeoutMs);
    if (err == ESP_ERR_TIMEOUT) {
        return false;
    }
    if (err != ESP_OK) {
        ESP_LOGD(TAG, "receive() error: %s", esp_err_to_name(err));
        vTaskDelay(pdMS_TO_TICKS(RX_ERROR_BACKOFF_MS));
        return false;
    }
    if (!decodeFrame(buf, len, out)) {
        ESP_LOGD(TAG, "RX: dropped undecodable frame (%zu bytes)", len);
        return false;
    }
    return true;
}

// ===========================================================================
// Pairing handshake
// ===========================================================================

esp_err_t RadioTransmitter::startPairing(DeviceId receiverId)
{
    uint8_t payload[8];
    putLe32(payload,     _pairingKey);
    putLe32(payload + 4, receiverId);

    // Sequence number carried by the Pairing frame; the Ack must echo it.
    const uint32_t seq = _seq.fetch_add(1);

    ESP_LOGI(TAG, "Pairing with receiver 0x%08lX (seq=%lu)",
             (unsigned long)receiverId, (unsigned long)seq);

    esp_err_t err = transmitFrame(FrameType::Pairing, seq, payload, sizeof(payload));
    if (err != ESP_OK) {
        return err;
    }

    const int64_t deadline = linkNowMs() + _cfg.pairingTimeoutMs;
    while (linkNowMs() < deadline) {
        Frame rx;
        if (!receiveFrame(_cfg.rxPollTimeoutMs, rx)) {
            continue;
        }
        if (rx.type != FrameType::Ack || rx.sequence != seq || rx.payload.size() < 4) {
            continue;
        }
        if (getLe32(rx.payload.data()) != receiverId) {
            ESP_LOGD(TAG, "Pairing Ack from unexpected receiver 0x%08lX",
                     (unsigned long)getLe32(rx.payload.data()));
            continue;
        }

        _receiver = receiverId;
        _paired   = true;
        _self.touch(linkNowMs());
        ESP_LOGI(TAG, "Paired with receiver 0x%08lX", (unsigned long)receiverId);
        return ESP_OK;
    }

    ESP_LOGW(TAG, "Pairing with 0x%08lX timed out after %lu ms",
             (unsigned long)receiverId, (unsigned long)_cfg.pairingTimeoutMs);
    return ESP_ERR_TIMEOUT;
}

// ===========================================================================
// Data / heartbeat
// ===========================================================================

esp_err_t RadioTransmitter::sendHeartbeat()
{
    if (!_paired.load()) {
        return ESP_ERR_INVALID_STATE;
    }
    esp_err_t err = sendFrame(FrameType::Heartbeat, nullptr, 0);
    if (err == ESP_OK) {
        ESP_LOGD(TAG, "Heartbeat sent (seq=%lu)", (unsigned long)(_seq.load() - 1));
    }
    return err;
}

esp_err_t RadioTransmitter::sendData(const uint8_t* data, size_t len)
{
    if (!_paired.load()) {
        return ESP_ERR_INVALID_STATE;
    }
    return sendFrame(FrameType::Data, data, len);
}

esp_err_t RadioTransmitter::sendDataReliable(const uint8_t* data, size_t len, uint32_t maxRetries)
{
    if (!_paired.load()) {
        return ESP_ERR_INVALID_STATE;
    }
    if (len > NRF_MAX_PAYLOAD) {
        ESP_LOGW(TAG, "sendDataReliable(): payload too large (%zu > %zu)", len, NRF_MAX_PAYLOAD);
        return ESP_ERR_INVALID_SIZE;
    }

    const uint32_t seq = _seq.fetch_add(1);

    for (uint32_t attempt = 0; attempt < maxRetries; ++attempt) {
        esp_err_t err = transmitFrame(FrameType::Data, seq, data, len);
        if (err != ESP_OK) {
            return err;
        }

        const int64_t deadline = linkNowMs() + _cfg.ackWindowMs;
        while (linkNowMs() < deadline) {
            Frame rx;
            if (receiveFrame(_cfg.ackPollMs, rx)
                && rx.type == FrameType::Ack
                && rx.sequence == seq)
            {
                ESP_LOGD(TAG, "ACK received for seq=%lu (attempt %lu)",
                         (unsigned long)seq, (unsigned long)(attempt + 1));
                return ESP_OK;
            }
        }

        if (attempt + 1 < maxRetries) {
            const uint32_t backoffMs = NRF_RETRY_BACKOFF_BASE_MS + NRF_RETRY_BACKOFF_STEP_MS * attempt;
            ESP_LOGD(TAG, "ACK timeout seq=%lu: retry %lu/%lu in %lu ms",
                     (unsigned long)seq, (unsigned long)(attempt + 2),
                     (unsigned long)maxRetries, (unsigned long)backoffMs);
            vTaskDelay(pdMS_TO_TICKS(backoffMs));
        }
    }

    ESP_LOGW(TAG, "ACK: max retries (%lu) exhausted for seq=%lu",
             (unsigned long)maxRetries, (unsigned long)seq);
    return ESP_ERR_TIMEOUT;
}

// ===========================================================================
// Heartbeat task
// ===========================================================================

esp_err_t RadioTransmitter::startHeartbeatTask()
{
    return _heartbeatTask.start([this]() {
        esp_err_t err = sendHeartbeat();
        if (err != ESP_OK) {
            ESP_LOGD(TAG, "Heartbeat skipped: %s", esp_err_to_name(err));
        }
    });
}

void RadioTransmitter::stopHeartbeatTask()
{
    _heartbeatTask.stop();
}
