#pragma once

/**
 * @file link_task.hpp
 * @brief FreeRTOS background task with cooperative cancellation.
 *
 * @details
 * Runs a body repeatedly on its own task: wait @c periodMs (skipped when the
 * period is 0), check the stop flag, run the body.  Used for the receive
 * polling loop (period 0, the body blocks in the radio receive), the
 * transmitter heartbeat and the receiver cleanup pass.
 *
 * Cancellation is cooperative.  requestStop() only raises a flag and wakes
 * the task; the loop observes it between two body runs, so a body that is in
 * the middle of a radio receive finishes that receive first.  stop() does the
 * same and then waits for the task to exit.
 *
 * Calling start() while a stop is pending but the task has not exited yet
 * cancels the stop and keeps the existing task; a second task is never
 * created.
 */

#include <atomic>
#include <cstdint>
#include <functional>

#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "link_mutex.hpp"

class LinkTask {
public:
    using Body = std::function<void()>;

    /// @param name       FreeRTOS task name (must outlive the task).
    /// @param periodMs   Delay before each body run, 0 for back-to-back runs.
    /// @param stackSize  Task stack in bytes.
    /// @param priority   FreeRTOS priority.
    LinkTask(const char* name, uint32_t periodMs, uint32_t stackSize, uint32_t priority);

    /// RAII destructor: stop() and wait for the task to exit.
    ~LinkTask();

    LinkTask(const LinkTask&)            = delete;
    LinkTask& operator=(const LinkTask&) = delete;

    /// Start the task running @p body.  Idempotent.
    /// @return ESP_OK | ESP_ERR_NO_MEM (xTaskCreate failed)
    esp_err_t start(Body body);

    /// Raise the stop flag and return immediately.
    void requestStop();

    /// Raise the stop flag and block until the task has exited.  Called from
    /// the task itself it degrades to requestStop().
    void stop();

    /// true while the FreeRTOS task exists (also during a pending stop).
    bool isRunning() const;

    /// true once requestStop() was called and start() has not cancelled it.
    bool stopRequested() const { return _stopRequested.load(); }

private:
    static void taskEntryStatic(void* arg);
    void taskLoop();

    /// Clears the task handle under the mutex if a stop is still pending.
    bool exitIfStopRequested();

    const char*       _name;
    uint32_t          _periodMs;
    uint32_t          _stackSize;
    uint32_t          _priority;

    Body              _body;
    std::atomic<bool> _stopRequested{false};

    // Guards _handle.  The task clears it under this mutex right before it
    // deletes itself, so a non-null handle seen under the mutex is alive.
    mutable LinkMutex _mutex;
    TaskHandle_t      _handle = nullptr;
};
