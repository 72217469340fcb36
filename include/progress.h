#ifndef XMODEM_PROGRESS_H
#define XMODEM_PROGRESS_H

#include <cstdint>
#include <functional>

namespace xmodem {

struct Progress {
    enum Kind {
        Waiting, // sender is about to wait for the receiver's first NAK
        Started, // handshake done, or the sender is about to send a payload
        Packet   // packet `packet` was exchanged successfully
    };

    Kind kind;
    uint8_t packet; // only meaningful for Packet

    static Progress waiting() { return Progress{Waiting, 0}; }
    static Progress started() { return Progress{Started, 0}; }
    static Progress packet_done(uint8_t seq) { return Progress{Packet, seq}; }
};

inline bool operator==(const Progress& a, const Progress& b) {
    return a.kind == b.kind && a.packet == b.packet;
}

using ProgressFn = std::function<void(Progress)>;

inline void noop_progress(Progress) {}

} // namespace xmodem

#endif // XMODEM_PROGRESS_H
