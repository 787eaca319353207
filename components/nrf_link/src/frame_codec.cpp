/**
 * @file frame_codec.cpp
 * @brief nrf_link frame encoder / decoder.
 *
 * @details
 * The payload CRC uses the ROM CRC-32 routine (esp_rom_crc32_le), which with a
 * zero seed yields the standard IEEE / zlib CRC-32.
 */

#include "frame_codec.hpp"

#include "esp_log.h"
#include "esp_rom_crc.h"

#include <cstring>

static const char* TAG = "FrameCodec";

// Header bytes that follow the length field (SenderId + Type + Sequence).
static constexpr size_t HEADER_WITHOUT_LEN = NRF_FRAME_HEADER_SIZE - NRF_LENGTH_FIELD_SIZE;

static constexpr size_t OFFSET_SENDER   = 1;
static constexpr size_t OFFSET_TYPE     = 5;
static constexpr size_t OFFSET_SEQUENCE = 6;

const char* frameTypeName(FrameType type)
{
    switch (type) {
        case FrameType::Pairing:   return "PAIRING";
        case FrameType::Data:      return "DATA";
        case FrameType::Heartbeat: return "HEARTBEAT";
        case FrameType::Ack:       return "ACK";
    }
    return "UNKNOWN";
}

uint32_t frameCrc32(const uint8_t* data, size_t len)
{
    if (len == 0 || data == nullptr) {
        return 0;
    }
    return esp_rom_crc32_le(0, data, static_cast<uint32_t>(len));
}

// ===========================================================================
// Encode
// ===========================================================================

size_t encodeFrame(const Frame& frame, uint8_t* out)
{
    size_t payloadLen = frame.payload.size();
    if (payloadLen > NRF_MAX_PAYLOAD) {
        ESP_LOGD(TAG, "encode: payload truncated %zu -> %zu", payloadLen, NRF_MAX_PAYLOAD);
        payloadLen = NRF_MAX_PAYLOAD;
    }

    const size_t bodyLen  = HEADER_WITHOUT_LEN + payloadLen + NRF_CRC_SIZE + NRF_TERMINATOR_SIZE;
    const size_t totalLen = NRF_LENGTH_FIELD_SIZE + bodyLen;

    out[0] = static_cast<uint8_t>(bodyLen);
    putLe32(out + OFFSET_SENDER, frame.senderId);
    out[OFFSET_TYPE] = static_cast<uint8_t>(frame.type);
    putLe32(out + OFFSET_SEQUENCE, frame.sequence);

    if (payloadLen > 0) {
        std::memcpy(out + NRF_FRAME_HEADER_SIZE, frame.payload.data(), payloadLen);
    }

    const uint32_t crc = frameCrc32(frame.payload.data(), payloadLen);
    putLe32(out + NRF_FRAME_HEADER_SIZE + payloadLen, crc);

    out[totalLen - 1] = NRF_FRAME_TERMINATOR;
    return totalLen;
}

std::vector<uint8_t> encodeFrame(const Frame& frame)
{
    uint8_t buf[NRF_MAX_FRAME_SIZE];
    const size_t len = encodeFrame(frame, buf);
    return std::vector<uint8_t>(buf, buf + len);
}

// ===========================================================================
// Decode
// ===========================================================================

bool decodeFrame(const uint8_t* data, size_t len, Frame& out)
{
    if (data == nullptr || len < NRF_MIN_FRAME_SIZE) {
        return false;
    }

    const size_t bodyLen = data[0];
    if (bodyLen == 0 || bodyLen + NRF_LENGTH_FIELD_SIZE > len) {
        return false;
    }

    if (data[NRF_LENGTH_FIELD_SIZE + bodyLen - 1] != NRF_FRAME_TERMINATOR) {
        return false;
    }

    if (bodyLen < HEADER_WITHOUT_LEN + NRF_CRC_SIZE + NRF_TERMINATOR_SIZE) {
        return false;
    }
    const size_t payloadLen = bodyLen - HEADER_WITHOUT_LEN - NRF_CRC_SIZE - NRF_TERMINATOR_SIZE;
    if (payloadLen > NRF_MAX_PAYLOAD) {
        return false;
    }

    const uint8_t* payload = data + NRF_FRAME_HEADER_SIZE;
    const uint32_t rxCrc   = getLe32(payload + payloadLen);
    const uint32_t calcCrc = frameCrc32(payload, payloadLen);
    if (rxCrc != calcCrc) {
        ESP_LOGD(TAG, "decode: CRC mismatch rx=0x%08lX calc=0x%08lX",
                 (unsigned long)rxCrc, (unsigned long)calcCrc);
        return false;
    }

    out.length   = static_cast<uint8_t>(bodyLen);
    out.senderId = getLe32(data + OFFSET_SENDER);
    out.type     = static_cast<FrameType>(data[OFFSET_TYPE]);
    out.sequence = getLe32(data + OFFSET_SEQUENCE);
    out.payload.assign(payload, payload + payloadLen);
    out.crc      = rxCrc;
    return true;
}
