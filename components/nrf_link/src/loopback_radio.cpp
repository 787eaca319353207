/**
 * @file loopback_radio.cpp
 * @brief In-memory radio medium.
 */

#include "loopback_radio.hpp"

#include "esp_log.h"

#include <algorithm>
#include <cstring>

static const char* TAG = "LoopbackRadio";

// ===========================================================================
// LoopbackMedium
// ===========================================================================

void LoopbackMedium::attach(LoopbackRadio* radio)
{
    LinkLockGuard lock(_mutex);
    if (std::find(_radios.begin(), _radios.end(), radio) == _radios.end()) {
        _radios.push_back(radio);
    }
}

void LoopbackMedium::detach(LoopbackRadio* radio)
{
    LinkLockGuard lock(_mutex);
    _radios.erase(std::remove(_radios.begin(), _radios.end(), radio), _radios.end());
}

size_t LoopbackMedium::broadcast(const LoopbackRadio* from, uint8_t channel,
                                 const uint8_t* data, size_t len)
{
    size_t delivered = 0;
    LinkLockGuard lock(_mutex);
    for (LoopbackRadio* r : _radios) {
        if (r == from || r->_channel != channel) {
            continue;
        }
        if (r->enqueue(data, len)) {
            ++delivered;
        }
    }
    return delivered;
}

size_t LoopbackMedium::radioCount() const
{
    LinkLockGuard lock(_mutex);
    return _radios.size();
}

// ===========================================================================
// LoopbackRadio
// ===========================================================================

LoopbackRadio::LoopbackRadio(LoopbackMedium& medium, uint8_t channel, size_t queueDepth)
    : _medium(medium),
      _rxQueue(xQueueCreate(queueDepth, sizeof(RxItem))),
      _channel(channel)
{
    if (_rxQueue == nullptr) {
        ESP_LOGE(TAG, "xQueueCreate failed (depth %zu)", queueDepth);
    }
    _medium.attach(this);
}

LoopbackRadio::~LoopbackRadio()
{
    _medium.detach(this);
    if (_rxQueue) {
        vQueueDelete(_rxQueue);
    }
}

void LoopbackRadio::startClock()
{
    _clockStarted = true;
}

esp_err_t LoopbackRadio::configure(uint32_t address, uint8_t prefix, uint8_t channel)
{
    if (channel > NRF_MAX_CHANNEL) {
        return ESP_ERR_INVALID_ARG;
    }
    if (_rxQueue == nullptr) {
        return ESP_ERR_NO_MEM;
    }
    _address = address;
    _prefix  = prefix;
    _channel = channel;
    return ESP_OK;
}

esp_err_t LoopbackRadio::setChannel(uint8_t channel)
{
    if (channel > NRF_MAX_CHANNEL) {
        return ESP_ERR_INVALID_ARG;
    }
    _channel = channel;
    return ESP_OK;
}

esp_err_t LoopbackRadio::transmit(const uint8_t* data, size_t len)
{
    if (len == 0 || len > NRF_MAX_FRAME_SIZE) {
        return ESP_ERR_INVALID_SIZE;
    }
    size_t n = _medium.broadcast(this, _channel, data, len);
    if (n == 0) {
        ESP_LOGW(TAG, "TX on channel %u: no listener", _channel);
    }
    return ESP_OK;
}

esp_err_t LoopbackRadio::receive(uint8_t* data, size_t capacity,
                                 size_t& outLen, uint32_t timeoutMs)
{
    if (_rxQueue == nullptr) {
        return ESP_ERR_NO_MEM;
    }

    RxItem item;
    if (xQueueReceive(_rxQueue, &item, pdMS_TO_TICKS(timeoutMs)) != pdTRUE) {
        return ESP_ERR_TIMEOUT;
    }
    if (item.len > capacity) {
        return ESP_ERR_INVALID_SIZE;
    }
    std::memcpy(data, item.buf, item.len);
    outLen = item.len;
    return ESP_OK;
}

bool LoopbackRadio::enqueue(const uint8_t* data, size_t len)
{
    if (_rxQueue == nullptr) {
        return false;
    }

    RxItem item;
    std::memcpy(item.buf, data, len);
    item.len = static_cast<uint8_t>(len);

    if (xQueueSend(_rxQueue, &item, 0) != pdTRUE) {
        _dropped = _dropped + 1;
        ESP_LOGW(TAG, "RX queue full on channel %u, frame dropped", _channel);
        return false;
    }
    return true;
}
