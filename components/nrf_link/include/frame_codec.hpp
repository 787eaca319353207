#pragma once

/**
 * @file frame_codec.hpp
 * @brief Wire format of an nrf_link frame and its encoder / decoder.
 *
 * @details
 * Every frame on air has the layout below.  All multi-byte fields are
 * little-endian regardless of the host byte order.
 * @verbatim
 *  offset  size  field
 *  ------  ----  ------------------------------------------------------
 *     0      1   bodyLength  (bytes after this field = total - 1)
 *     1      4   senderId
 *     5      1   type        (FrameType)
 *     6      4   sequence
 *    10      N   payload     (0 .. NRF_MAX_PAYLOAD)
 *  10+N      4   CRC-32 of the payload only (IEEE, 0 for empty payload)
 *  14+N      1   terminator  (NRF_FRAME_TERMINATOR)
 * @endverbatim
 *
 * The codec is stateless and safe to call from any task.
 */

#include <cstdint>
#include <cstddef>
#include <vector>

// ============================================================================
// Wire-format constants
// ============================================================================

/// @brief Largest frame the link ever puts on air, all fields included.
static constexpr size_t NRF_MAX_FRAME_SIZE      = 128;

static constexpr size_t NRF_LENGTH_FIELD_SIZE   = 1;
static constexpr size_t NRF_SEQUENCE_FIELD_SIZE = 4;
static constexpr size_t NRF_CRC_SIZE            = 4;
static constexpr size_t NRF_TERMINATOR_SIZE     = 1;

/// @brief Length(1) + SenderId(4) + Type(1) + Sequence(4).
static constexpr size_t NRF_FRAME_HEADER_SIZE   =
    NRF_LENGTH_FIELD_SIZE + 4 + 1 + NRF_SEQUENCE_FIELD_SIZE;

/// @brief Smallest decodable frame (empty payload).
static constexpr size_t NRF_MIN_FRAME_SIZE      =
    NRF_FRAME_HEADER_SIZE + NRF_CRC_SIZE + NRF_TERMINATOR_SIZE;

/// @brief Largest application payload that fits in one frame (113 bytes).
static constexpr size_t NRF_MAX_PAYLOAD         =
    NRF_MAX_FRAME_SIZE - NRF_FRAME_HEADER_SIZE - NRF_CRC_SIZE - NRF_TERMINATOR_SIZE;

/// @brief Fixed value of the last byte of every frame.
static constexpr uint8_t NRF_FRAME_TERMINATOR   = 0x55;

// ============================================================================
// Frame model
// ============================================================================

/// @brief 32-bit device identity chosen by the application.
using DeviceId = uint32_t;

/// @brief Frame type tags carried in the header type byte.
enum class FrameType : uint8_t {
    Pairing   = 0x01,
    Data      = 0x02,
    Heartbeat = 0x03,
    Ack       = 0x04,
};

/// @brief Human-readable name of a frame type, "UNKNOWN" for foreign tags.
const char* frameTypeName(FrameType type);

/**
 * @brief In-memory representation of one frame.
 *
 * @c length and @c crc are filled in by decodeFrame(); encodeFrame() ignores
 * them and computes both from the payload.
 */
struct Frame {
    uint8_t              length   = 0;   ///< Body length as found on air
    DeviceId             senderId = 0;   ///< Identity of the transmitting endpoint
    FrameType            type     = FrameType::Data;
    uint32_t             sequence = 0;   ///< Per-transmitter sequence number
    std::vector<uint8_t> payload;        ///< Owned copy, never aliases a radio buffer
    uint32_t             crc      = 0;   ///< CRC-32 received on air (decoded frames only)
};

// ============================================================================
// Codec
// ============================================================================

/**
 * @brief Serialise @p frame into @p out.
 *
 * Payloads longer than NRF_MAX_PAYLOAD are silently truncated so the result
 * never exceeds NRF_MAX_FRAME_SIZE.  Encoding cannot fail.
 *
 * @param frame  Frame to encode.
 * @param out    Destination buffer, at least NRF_MAX_FRAME_SIZE bytes.
 * @return Number of bytes written (NRF_MIN_FRAME_SIZE .. NRF_MAX_FRAME_SIZE).
 */
size_t encodeFrame(const Frame& frame, uint8_t* out);

/// @brief Convenience overload returning the encoded bytes in a vector.
std::vector<uint8_t> encodeFrame(const Frame& frame);

/**
 * @brief Parse and validate one frame.
 *
 * Rejects buffers shorter than NRF_MIN_FRAME_SIZE, a zero or out-of-bounds
 * body length, a missing terminator, an impossible payload length and a CRC
 * mismatch.  Bytes past the terminator are ignored.
 *
 * @param data  Received bytes.
 * @param len   Number of bytes in @p data.
 * @param out   Receives the decoded frame on success; untouched otherwise.
 * @return true if @p data held a valid frame.
 */
bool decodeFrame(const uint8_t* data, size_t len, Frame& out);

/// @brief CRC-32 (IEEE 802.3, zlib compatible) used for the payload check.
uint32_t frameCrc32(const uint8_t* data, size_t len);

// ============================================================================
// Little-endian helpers shared by the transport layer
// ============================================================================

inline void putLe32(uint8_t* dst, uint32_t v)
{
    dst[0] = static_cast<uint8_t>(v);
    dst[1] = static_cast<uint8_t>(v >> 8);
    dst[2] = static_cast<uint8_t>(v >> 16);
    dst[3] = static_cast<uint8_t>(v >> 24);
}

inline uint32_t getLe32(const uint8_t* src)
{
    return  static_cast<uint32_t>(src[0])
         | (static_cast<uint32_t>(src[1]) << 8)
         | (static_cast<uint32_t>(src[2]) << 16)
         | (static_cast<uint32_t>(src[3]) << 24);
}
