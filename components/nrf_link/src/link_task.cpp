/**
 * @file link_task.cpp
 * @brief Background task primitive shared by the transmitter and receiver.
 */

#include "link_task.hpp"

#include "esp_log.h"

#include <utility>

static const char* TAG = "LinkTask";

// Poll interval used by stop() while waiting for the task to exit.
static constexpr uint32_t STOP_POLL_MS = 5;

LinkTask::LinkTask(const char* name, uint32_t periodMs, uint32_t stackSize, uint32_t priority)
    : _name(name),
      _periodMs(periodMs),
      _stackSize(stackSize),
      _priority(priority)
{
}

LinkTask::~LinkTask()
{
    stop();
}

// ===========================================================================
// Lifecycle
// ===========================================================================

esp_err_t LinkTask::start(Body body)
{
    LinkLockGuard lock(_mutex);
    _stopRequested = false;

    if (_handle) {
        // Still alive (possibly draining a stop request); keep it.
        return ESP_OK;
    }

    _body = std::move(body);

    // The new task cannot clear _handle before this assignment completes
    // because exitIfStopRequested() needs the mutex held here.
    BaseType_t ok = xTaskCreate(
        taskEntryStatic,
        _name,
        _stackSize,
        this,
        _priority,
        &_handle
    );

    if (ok != pdPASS) {
        _handle = nullptr;
        ESP_LOGE(TAG, "%s: xTaskCreate failed", _name);
        return ESP_ERR_NO_MEM;
    }

    ESP_LOGD(TAG, "%s started (period %lu ms)", _name, (unsigned long)_periodMs);
    return ESP_OK;
}

void LinkTask::requestStop()
{
    _stopRequested = true;

    LinkLockGuard lock(_mutex);
    if (_handle) {
        xTaskNotifyGive(_handle);   // cut a pending period wait short
    }
}

void LinkTask::stop()
{
    requestStop();

    {
        LinkLockGuard lock(_mutex);
        if (_handle == nullptr) {
            return;
        }
        if (_handle == xTaskGetCurrentTaskHandle()) {
            return;   // the loop exits after the current body run
        }
    }

    while (isRunning()) {
        vTaskDelay(pdMS_TO_TICKS(STOP_POLL_MS));
    }
    ESP_LOGD(TAG, "%s stopped", _name);
}

bool LinkTask::isRunning() const
{
    LinkLockGuard lock(_mutex);
    return _handle != nullptr;
}

// ===========================================================================
// Task body
// ===========================================================================

void LinkTask::taskEntryStatic(void* arg)
{
    static_cast<LinkTask*>(arg)->taskLoop();
    // No member access past this point: the owner may already be destroyed.
    vTaskDelete(nullptr);
}

bool LinkTask::exitIfStopRequested()
{
    if (!_stopRequested.load()) {
        return false;
    }
    LinkLockGuard lock(_mutex);
    if (!_stopRequested.load()) {
        return false;   // start() cancelled the stop in the meantime
    }
    _handle = nullptr;
    return true;
}

void LinkTask::taskLoop()
{
    while (true) {
        if (_periodMs > 0) {
            ulTaskNotifyTake(pdTRUE, pdMS_TO_TICKS(_periodMs));
        }
        if (exitIfStopRequested()) {
            return;
        }
        _body();
    }
}
