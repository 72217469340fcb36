#ifndef XMODEM_SENDER_H
#define XMODEM_SENDER_H

#include <cstddef>
#include <istream>
#include <memory>
#include "progress.h"
#include "protocol_engine.h"
#include "transport.h"

namespace xmodem {

// Sends everything `data` yields through `engine`, zero-padding the last
// block to PACKET_SIZE, then ends the transfer with EOT.
// Returns the number of data bytes sent, padding excluded.
std::size_t transmit(std::istream& data, ProtocolEngine& engine);

std::size_t transmit(std::istream& data, std::unique_ptr<Transport> to,
                     ProgressFn progress = noop_progress);

} // namespace xmodem

#endif // XMODEM_SENDER_H
