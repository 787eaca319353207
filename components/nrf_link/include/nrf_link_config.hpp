#pragma once

/**
 * @file nrf_link_config.hpp
 * @brief Compile-time defaults and runtime configuration for the nrf_link component.
 *
 * @details
 * Every tunable has a @c CONFIG_NRF_LINK_* macro.  The build system sets them
 * from its cache variables; the values below are the documented defaults used
 * when a macro is not supplied.  LinkConfig carries the same values at runtime
 * so @c LinkConfig{} is a valid configuration and callers (or tests) can
 * override individual members.
 */

#include <cstdint>
#include <cstddef>

#include "sdkconfig.h"

#ifndef CONFIG_NRF_LINK_DEFAULT_CHANNEL
#define CONFIG_NRF_LINK_DEFAULT_CHANNEL        7
#endif

#ifndef CONFIG_NRF_LINK_DEFAULT_ADDRESS
#define CONFIG_NRF_LINK_DEFAULT_ADDRESS        0xE7E7E7E7u
#endif

#ifndef CONFIG_NRF_LINK_DEFAULT_PREFIX
#define CONFIG_NRF_LINK_DEFAULT_PREFIX         0xE7u
#endif

#ifndef CONFIG_NRF_LINK_HEARTBEAT_INTERVAL_MS
#define CONFIG_NRF_LINK_HEARTBEAT_INTERVAL_MS  5000
#endif

#ifndef CONFIG_NRF_LINK_PAIRING_TIMEOUT_MS
#define CONFIG_NRF_LINK_PAIRING_TIMEOUT_MS     30000
#endif

#ifndef CONFIG_NRF_LINK_DEVICE_TIMEOUT_MS
#define CONFIG_NRF_LINK_DEVICE_TIMEOUT_MS      15000
#endif

#ifndef CONFIG_NRF_LINK_RX_POLL_TIMEOUT_MS
#define CONFIG_NRF_LINK_RX_POLL_TIMEOUT_MS     100
#endif

#ifndef CONFIG_NRF_LINK_ACK_WINDOW_MS
#define CONFIG_NRF_LINK_ACK_WINDOW_MS          200
#endif

#ifndef CONFIG_NRF_LINK_ACK_POLL_MS
#define CONFIG_NRF_LINK_ACK_POLL_MS            20
#endif

#ifndef CONFIG_NRF_LINK_RECEIVE_DATA_TIMEOUT_MS
#define CONFIG_NRF_LINK_RECEIVE_DATA_TIMEOUT_MS 5000
#endif

#ifndef CONFIG_NRF_LINK_TASK_STACK_SIZE
#define CONFIG_NRF_LINK_TASK_STACK_SIZE        4096
#endif

#ifndef CONFIG_NRF_LINK_TASK_PRIORITY
#define CONFIG_NRF_LINK_TASK_PRIORITY          5
#endif

#ifndef CONFIG_NRF_LINK_LOOPBACK_QUEUE_DEPTH
#define CONFIG_NRF_LINK_LOOPBACK_QUEUE_DEPTH   16
#endif

/// Compiles the *ForTest() hooks.  Must stay 0 in production firmware.
#ifndef CONFIG_NRF_LINK_ENABLE_TEST_SEAM
#define CONFIG_NRF_LINK_ENABLE_TEST_SEAM       0
#endif

/// Pairing keys come from esp_fill_random() when set, from a time-seeded
/// rand() otherwise.
#ifndef CONFIG_NRF_LINK_PAIRING_KEY_HW_RNG
#define CONFIG_NRF_LINK_PAIRING_KEY_HW_RNG     1
#endif

// ============================================================================
// Protocol constants
// ============================================================================

/// @brief Highest valid RF channel (2400 MHz + channel).
static constexpr uint8_t NRF_MAX_CHANNEL = 125;

/// @brief Base backoff before a reliable-send retry; grows by
/// NRF_RETRY_BACKOFF_STEP_MS per attempt.
static constexpr uint32_t NRF_RETRY_BACKOFF_BASE_MS = 20;
static constexpr uint32_t NRF_RETRY_BACKOFF_STEP_MS = 10;

// ============================================================================
// Runtime configuration
// ============================================================================

/**
 * @brief Runtime configuration shared by RadioTransmitter and RadioReceiver.
 *
 * All fields default to the @c CONFIG_NRF_LINK_* values.
 */
struct LinkConfig {
    // Radio addressing
    uint32_t address              = CONFIG_NRF_LINK_DEFAULT_ADDRESS;
    uint8_t  prefix               = CONFIG_NRF_LINK_DEFAULT_PREFIX;
    uint8_t  channel              = CONFIG_NRF_LINK_DEFAULT_CHANNEL;
    // Protocol timing
    uint32_t heartbeatIntervalMs  = CONFIG_NRF_LINK_HEARTBEAT_INTERVAL_MS;
    uint32_t pairingTimeoutMs     = CONFIG_NRF_LINK_PAIRING_TIMEOUT_MS;
    uint32_t deviceTimeoutMs      = CONFIG_NRF_LINK_DEVICE_TIMEOUT_MS;
    uint32_t rxPollTimeoutMs      = CONFIG_NRF_LINK_RX_POLL_TIMEOUT_MS;
    uint32_t ackWindowMs          = CONFIG_NRF_LINK_ACK_WINDOW_MS;
    uint32_t ackPollMs            = CONFIG_NRF_LINK_ACK_POLL_MS;
    uint32_t receiveDataTimeoutMs = CONFIG_NRF_LINK_RECEIVE_DATA_TIMEOUT_MS;
    // FreeRTOS task knobs
    uint32_t taskStackSize        = CONFIG_NRF_LINK_TASK_STACK_SIZE;
    uint32_t taskPriority         = CONFIG_NRF_LINK_TASK_PRIORITY;
};
