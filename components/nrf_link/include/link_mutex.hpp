#pragma once

/**
 * @file link_mutex.hpp
 * @brief Statically allocated FreeRTOS mutex with a scoped guard.
 *
 * @details
 * The semaphore control block lives inside the object, so construction can
 * not fail and no heap is touched.  Hold a LinkLockGuard only around table
 * reads and writes; never across radio I/O or an application callback.
 */

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

class LinkMutex {
public:
    LinkMutex() : _handle(xSemaphoreCreateMutexStatic(&_storage)) {}
    ~LinkMutex() { vSemaphoreDelete(_handle); }

    LinkMutex(const LinkMutex&)            = delete;
    LinkMutex& operator=(const LinkMutex&) = delete;

    void lock()   { xSemaphoreTake(_handle, portMAX_DELAY); }
    void unlock() { xSemaphoreGive(_handle); }

private:
    StaticSemaphore_t _storage;
    SemaphoreHandle_t _handle;
};

class LinkLockGuard {
public:
    explicit LinkLockGuard(LinkMutex& m) : _m(m) { _m.lock(); }
    ~LinkLockGuard() { _m.unlock(); }

    LinkLockGuard(const LinkLockGuard&)            = delete;
    LinkLockGuard& operator=(const LinkLockGuard&) = delete;

private:
    LinkMutex& _m;
};
