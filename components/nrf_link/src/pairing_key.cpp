/**
 * @file pairing_key.cpp
 * @brief Pairing-key source.
 */

#include "pairing_key.hpp"
#include "nrf_link_config.hpp"

#include "esp_log.h"
#include "esp_random.h"
#include "esp_timer.h"

#include <cstdlib>   // rand(), srand()

static const char* TAG = "PairingKey";

uint32_t generatePairingKey()
{
    uint32_t key = 0;
#if CONFIG_NRF_LINK_PAIRING_KEY_HW_RNG
    esp_fill_random(&key, sizeof(key));
#else
    // Hardware RNG disabled in this build: fall back to a time-seeded PRNG.
    srand(static_cast<unsigned>(esp_timer_get_time()));
    key = (static_cast<uint32_t>(rand() & 0xFFFF) << 16)
        |  static_cast<uint32_t>(rand() & 0xFFFF);
    ESP_LOGW(TAG, "Using time-seeded pairing key (hardware RNG disabled)");
#endif
    ESP_LOGD(TAG, "Generated pairing key 0x%08lX", (unsigned long)key);
    return key;
}
