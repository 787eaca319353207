#pragma once

/**
 * @file pairing_key.hpp
 * @brief Session pairing-key generation.
 *
 * The key is an opaque session token, not a cryptographic secret.
 */

#include <cstdint>

/// @brief Fresh 32-bit pairing key from the hardware RNG, or from a
/// time-seeded rand() when CONFIG_NRF_LINK_PAIRING_KEY_HW_RNG is 0.
uint32_t generatePairingKey();
