#ifndef XMODEM_PROTOCOL_ENGINE_H
#define XMODEM_PROTOCOL_ENGINE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include "constants.h"
#include "progress.h"
#include "transport.h"

namespace xmodem {

// One side of an XMODEM transfer. The same engine can send (write_packet)
// or receive (read_packet); it owns the transport for its whole lifetime.
class ProtocolEngine {
private:
    std::unique_ptr<Transport> transport_;
    uint8_t packet_ = FIRST_SEQUENCE;
    bool started_ = false;
    ProgressFn progress_;

    uint8_t read_byte(bool abort_on_can);
    void write_byte(uint8_t byte);
    uint8_t expect_byte(uint8_t byte, const char* expected);
    uint8_t expect_byte_or_cancel(uint8_t byte, const char* expected);

public:
    explicit ProtocolEngine(std::unique_ptr<Transport> transport,
                            ProgressFn progress = noop_progress);

    /**
     * Receives one packet into `buf`, which must hold at least PACKET_SIZE
     * bytes. Sends the initial NAK on the first call.
     *
     * Returns PACKET_SIZE for a data packet, or 0 once the sender has
     * finished with EOT.
     *
     * Throws XmodemError: BufferTooSmall (no I/O done), InvalidProtocolByte,
     * ChecksumMismatch (NAK already sent, ask again), Aborted, or whatever
     * the transport raises.
     */
    std::size_t read_packet(uint8_t* buf, std::size_t len);

    /**
     * Sends one packet. `len` must be 0 or at least PACKET_SIZE; an empty
     * buffer ends the transfer with the EOT handshake. Waits for the
     * receiver's NAK on the first call.
     *
     * Returns `len` on ACK, 0 after the EOT handshake.
     *
     * Throws XmodemError: BufferTooSmall (no I/O done), InvalidProtocolByte,
     * ChecksumMismatch (receiver NAKed the packet), Aborted, or whatever the
     * transport raises.
     */
    std::size_t write_packet(const uint8_t* buf, std::size_t len);

    void flush();

    uint8_t sequence_number() const { return packet_; }
    bool started() const { return started_; }

    void print_stats(std::ostream& out) const;
};

} // namespace xmodem

#endif // XMODEM_PROTOCOL_ENGINE_H
