#include "protocol_engine.h"
#include "packet.h"
#include "xmodem_error.h"

#include <utility>

namespace xmodem {

ProtocolEngine::ProtocolEngine(std::unique_ptr<Transport> transport, ProgressFn progress)
    : transport_(std::move(transport)), progress_(std::move(progress)) {
    if (!progress_) progress_ = noop_progress;
}

// ── Byte primitives ──

uint8_t ProtocolEngine::read_byte(bool abort_on_can) {
    uint8_t byte = 0;
    transport_->read_exact(&byte, 1);
    if (abort_on_can && byte == CAN) {
        throw XmodemError(ErrorKind::Aborted, "received CAN");
    }
    return byte;
}

void ProtocolEngine::write_byte(uint8_t byte) {
    transport_->write_all(&byte, 1);
}

uint8_t ProtocolEngine::expect_byte(uint8_t byte, const char* expected) {
    uint8_t b = read_byte(true);
    if (b != byte) {
        throw XmodemError(ErrorKind::InvalidProtocolByte, expected);
    }
    return b;
}

// Like expect_byte, but a mismatch is answered with CAN before failing.
uint8_t ProtocolEngine::expect_byte_or_cancel(uint8_t byte, const char* expected) {
    uint8_t b = read_byte(false);
    if (b == byte) {
        return b;
    }
    write_byte(CAN);
    if (b == CAN) {
        throw XmodemError(ErrorKind::Aborted, "received CAN");
    }
    throw XmodemError(ErrorKind::InvalidProtocolByte, expected);
}

// ── Receiving ──

std::size_t ProtocolEngine::read_packet(uint8_t* buf, std::size_t len) {
    if (len < PACKET_SIZE) {
        throw XmodemError(ErrorKind::BufferTooSmall, "invalid packet format");
    }

    if (!started_) {
        write_byte(NAK);
        started_ = true;
        progress_(Progress::started());
    }

    uint8_t byte = read_byte(true);
    if (byte == SOH) {
        // A bad packet number is reported to the peer, but the packet is
        // still read and checked.
        if (read_byte(true) != packet_) {
            write_byte(CAN);
        }
        if (read_byte(true) != static_cast<uint8_t>(~packet_)) {
            write_byte(CAN);
        }
    } else if (byte == EOT) {
        write_byte(NAK);
        expect_byte(EOT, "expected EOT byte");
        write_byte(ACK);
        return 0;
    } else {
        throw XmodemError(ErrorKind::InvalidProtocolByte, "expected SOH or EOT byte");
    }

    uint8_t sum = 0;
    for (std::size_t i = 0; i < PAYLOAD_SIZE; ++i) {
        buf[i] = read_byte(true);
        sum = static_cast<uint8_t>(sum + buf[i]);
    }

    if (read_byte(true) != sum) {
        write_byte(NAK);
        throw XmodemError(ErrorKind::ChecksumMismatch, "checksum failed");
    }

    progress_(Progress::packet_done(packet_));
    packet_++;
    write_byte(ACK);
    return PACKET_SIZE;
}

// ── Sending ──

std::size_t ProtocolEngine::write_packet(const uint8_t* buf, std::size_t len) {
    if (len < PACKET_SIZE && len != 0) {
        throw XmodemError(ErrorKind::BufferTooSmall, "unexpected packet format");
    }

    if (!started_) {
        progress_(Progress::waiting());
        expect_byte_or_cancel(NAK, "expected NAK as first byte");
        started_ = true;
        progress_(Progress::started());
    }

    if (len == 0) {
        write_byte(EOT);
        expect_byte(NAK, "expected NAK to end the transmission");
        write_byte(EOT);
        expect_byte(ACK, "expected ACK to end the transmission");
        started_ = false;
        return 0;
    }

    write_byte(SOH);
    write_byte(packet_);
    read_byte(true);
    write_byte(static_cast<uint8_t>(~packet_));
    read_byte(true);

    progress_(Progress::started());
    transport_->write_all(buf, PAYLOAD_SIZE);
    write_byte(checksum(buf, PAYLOAD_SIZE));

    switch (read_byte(true)) {
        case ACK:
            progress_(Progress::packet_done(packet_));
            packet_++;
            return len;
        case NAK:
            throw XmodemError(ErrorKind::ChecksumMismatch, "checksum failed");
        default:
            throw XmodemError(ErrorKind::InvalidProtocolByte, "expected ACK or NAK");
    }
}

void ProtocolEngine::flush() {
    transport_->flush();
}

void ProtocolEngine::print_stats(std::ostream& out) const {
    out << "Packet: " << (int)packet_
        << " | Started: " << (started_ ? "yes" : "no") << std::endl;
}

} // namespace xmodem
