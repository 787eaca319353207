/**
 * @file radio_receiver.cpp
 * @brief Receiver side of the nrf_link protocol.
 */

#include "radio_receiver.hpp"

#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <utility>

static const char* TAG = "RadioReceiver";

// Poll interval of startPairing() while the listen task does the receiving.
static constexpr uint32_t PAIRING_POLL_MS     = 10;
static constexpr uint32_t RX_ERROR_BACKOFF_MS = 10;

// ===========================================================================
// Constructor / Destructor
// ===========================================================================

RadioReceiver::RadioReceiver(DeviceId id,
                             std::unique_ptr<IRadioDriver> driver,
                             const LinkConfig& cfg)
    : _cfg(cfg),
      _driver(std::move(driver)),
      _self(Device::create(id, cfg)),
      _registry(cfg),
      _listenTask("nrf_rx", 0, cfg.taskStackSize, cfg.taskPriority),
      _cleanupTask("nrf_cleanup", cfg.deviceTimeoutMs / 2, cfg.taskStackSize, cfg.taskPriority)
{
}

RadioReceiver::~RadioReceiver()
{
    // Both task bodies touch members; they must be gone before anything else.
    _listenTask.stop();
    _cleanupTask.stop();
}

// ===========================================================================
// Lifecycle
// ===========================================================================

esp_err_t RadioReceiver::init()
{
    _driver->startClock();
    esp_err_t err = _driver->configure(_self.address, _self.prefix, _self.channel);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "configure() failed: %s", esp_err_to_name(err));
        return err;
    }
    ESP_LOGI(TAG, "Receiver 0x%08lX ready on channel %u",
             (unsigned long)_self.id, _self.channel);
    return ESP_OK;
}

esp_err_t RadioReceiver::setChannel(uint8_t channel)
{
    if (channel > NRF_MAX_CHANNEL) {
        ESP_LOGW(TAG, "setChannel(): invalid channel %u", channel);
        return ESP_ERR_INVALID_ARG;
    }
    _self.channel = channel;
    return _driver->setChannel(channel);
}

// ===========================================================================
// Callbacks
// ===========================================================================

void RadioReceiver::registerCallback(FrameType type, FrameCallback cb)
{
    LinkLockGuard lock(_callbackMutex);
    if (cb) {
        _callbacks[type] = std::move(cb);
    } else {
        _callbacks.erase(type);
    }
}

void RadioReceiver::dispatch(FrameType type, const Frame& frame)
{
    FrameCallback cb;
    {
        LinkLockGuard lock(_callbackMutex);
        auto it = _callbacks.find(type);
        if (it == _callbacks.end()) {
            return;
        }
        cb = it->second;
    }
    const Frame copy = frame;
    cb(copy);
}

// ===========================================================================
// Frame processing
// ===========================================================================

void RadioReceiver::processFrame(const Frame& frame)
{
    switch (frame.type) {
        case FrameType::Pairing:
            handlePairing(frame);
            break;
        case FrameType::Heartbeat:
            if (handleHeartbeat(frame)) {
                dispatch(FrameType::Heartbeat, frame);
            }
            break;
        case FrameType::Data:
            if (handleData(frame)) {
                dispatch(FrameType::Data, frame);
            }
            break;
        default:
            ESP_LOGD(TAG, "RX %s from 0x%08lX ignored",
                     frameTypeName(frame.type), (unsigned long)frame.senderId);
            break;
    }
}

void RadioReceiver::handlePairing(const Frame& frame)
{
    if (frame.payload.size() < 8) {
        ESP_LOGD(TAG, "Pairing from 0x%08lX: short payload (%zu bytes)",
                 (unsigned long)frame.senderId, frame.payload.size());
        return;
    }

    const uint32_t key    = getLe32(frame.payload.data());
    const DeviceId target = getLe32(frame.payload.data() + 4);
    if (target != _self.id) {
        ESP_LOGD(TAG, "Pairing from 0x%08lX for 0x%08lX: not us",
                 (unsigned long)frame.senderId, (unsigned long)target);
        return;
    }

    _registry.upsertOnPairing(frame.senderId, key);
    ESP_LOGI(TAG, "Paired with transmitter 0x%08lX", (unsigned long)frame.senderId);

    esp_err_t err = sendAck(frame.senderId, frame.sequence);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Pairing Ack to 0x%08lX failed: %s",
                 (unsigned long)frame.senderId, esp_err_to_name(err));
    }

    _pairingEvents.fetch_add(1);
    dispatch(FrameType::Pairing, frame);
}

bool RadioReceiver::handleHeartbeat(const Frame& frame)
{
    if (!_registry.touch(frame.senderId)) {
        ESP_LOGD(TAG, "Heartbeat from unpaired 0x%08lX ignored", (unsigned long)frame.senderId);
        return false;
    }
    ESP_LOGD(TAG, "Heartbeat from 0x%08lX", (unsigned long)frame.senderId);
    return true;
}

bool RadioReceiver::handleData(const Frame& frame)
{
    if (frame.payload.empty()) {
        return false;
    }
    if (!_registry.touch(frame.senderId)) {
        ESP_LOGD(TAG, "Data from unpaired 0x%08lX ignored", (unsigned long)frame.senderId);
        return false;
    }

    esp_err_t err = sendAck(frame.senderId, frame.sequence);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Data Ack seq=%lu to 0x%08lX failed: %s",
                 (unsigned long)frame.sequence, (unsigned long)frame.senderId,
                 esp_err_to_name(err));
    }
    ESP_LOGD(TAG, "Data from 0x%08lX seq=%lu len=%zu",
             (unsigned long)frame.senderId, (unsigned long)frame.sequence,
             frame.payload.size());
    return true;
}

esp_err_t RadioReceiver::sendAck(DeviceId to, uint32_t seq)
{
    Frame ack;
    ack.senderId = _self.id;
    ack.type     = FrameType::Ack;
    ack.sequence = seq;
    ack.payload.resize(4);
    putLe32(ack.payload.data(), _self.id);

    uint8_t buf[NRF_MAX_FRAME_SIZE];
    const size_t len = encodeFrame(ack, buf);

    esp_err_t err = _driver->transmit(buf, len);
    if (err == ESP_OK) {
        ESP_LOGD(TAG, "TX Ack seq=%lu to 0x%08lX", (unsigned long)seq, (unsigned long)to);
    }
    return err;
}

bool RadioReceiver::receiveFrame(uint32_t timeoutMs, Frame& out)
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
// Listening
// ===========================================================================

esp_err_t RadioReceiver::listen()
{
    esp_err_t err = _listenTask.start([this]() {
        Frame frame;
        if (receiveFrame(_cfg.rxPollTimeoutMs, frame)) {
            processFrame(frame);
        }
    });
    if (err == ESP_OK) {
        ESP_LOGD(TAG, "Listening on channel %u", _self.channel);
    }
    return err;
}

void RadioReceiver::stopListening()
{
    _listenTask.requestStop();
}

bool RadioReceiver::isListening() const
{
    return _listenTask.isRunning() && !_listenTask.stopRequested();
}

esp_err_t RadioReceiver::startPairing()
{
    const uint32_t before       = _pairingEvents.load();
    const bool     wasListening = isListening();

    if (!wasListening) {
        esp_err_t err = listen();
        if (err != ESP_OK) {
            return err;
        }
    }

    ESP_LOGI(TAG, "Waiting for pairing (%lu ms)", (unsigned long)_cfg.pairingTimeoutMs);

    bool paired = false;
    const int64_t deadline = linkNowMs() + _cfg.pairingTimeoutMs;
    while (linkNowMs() < deadline) {
        if (_pairingEvents.load() != before) {
            paired = true;
            break;
        }
        vTaskDelay(pdMS_TO_TICKS(PAIRING_POLL_MS));
    }

    if (!wasListening) {
        stopListening();
    }

    if (!paired) {
        ESP_LOGW(TAG, "Pairing window closed without a request");
        return ESP_ERR_TIMEOUT;
    }
    return ESP_OK;
}

esp_err_t RadioReceiver::receiveData(std::vector<uint8_t>& out)
{
    if (_registry.empty()) {
        return ESP_ERR_INVALID_STATE;
    }

    const int64_t deadline = linkNowMs() + _cfg.receiveDataTimeoutMs;
    while (linkNowMs() < deadline) {
        Frame frame;
        if (!receiveFrame(_cfg.rxPollTimeoutMs, frame)) {
            continue;
        }
        processFrame(frame);

        if (frame.type == FrameType::Data
            && !frame.payload.empty()
            && _registry.isPaired(frame.senderId))
        {
            out = frame.payload;
            return ESP_OK;
        }
    }
    return ESP_ERR_TIMEOUT;
}

// ===========================================================================
// Liveness
// ===========================================================================

esp_err_t RadioReceiver::startCleanupTask()
{
    return _cleanupTask.start([this]() {
        cleanupDeadDevices();
    });
}

void RadioReceiver::stopCleanupTask()
{
    _cleanupTask.stop();
}

size_t RadioReceiver::cleanupDeadDevices()
{
    return _registry.evictStale(linkNowMs());
}

bool RadioReceiver::isPairedDeviceConnected() const
{
    return _registry.anyAlive(linkNowMs());
}
