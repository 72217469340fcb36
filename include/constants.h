#ifndef XMODEM_CONSTANTS_H
#define XMODEM_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace xmodem {

// Control bytes
constexpr uint8_t SOH = 0x01;
constexpr uint8_t EOT = 0x04;
constexpr uint8_t ACK = 0x06;
constexpr uint8_t NAK = 0x15;
constexpr uint8_t CAN = 0x18;

// Block size handed to read_packet/write_packet
constexpr std::size_t PACKET_SIZE = 128;
// Payload bytes that go on the wire after SOH, seq, ~seq
constexpr std::size_t PAYLOAD_SIZE = PACKET_SIZE - 1;

constexpr uint8_t FIRST_SEQUENCE = 1;

// Attempts per packet before the driver gives up
constexpr int MAX_ATTEMPTS = 10;

} // namespace xmodem

#endif // XMODEM_CONSTANTS_H
