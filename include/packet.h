#ifndef XMODEM_PACKET_H
#define XMODEM_PACKET_H

#include <array>
#include <cstddef>
#include <cstdint>
#include "constants.h"

namespace xmodem {

using PacketBuffer = std::array<uint8_t, PACKET_SIZE>;

// 8-bit sum of `len` bytes, wrapping modulo 256.
inline uint8_t checksum(const uint8_t* data, std::size_t len) {
    uint8_t sum = 0;
    for (std::size_t i = 0; i < len; ++i) {
        sum = static_cast<uint8_t>(sum + data[i]);
    }
    return sum;
}

} // namespace xmodem

#endif // XMODEM_PACKET_H
