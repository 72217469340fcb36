#ifndef XMODEM_RECEIVER_H
#define XMODEM_RECEIVER_H

#include <cstddef>
#include <memory>
#include <ostream>
#include "progress.h"
#include "protocol_engine.h"
#include "transport.h"

namespace xmodem {

// Receives packets through `engine` into `into` until the sender's EOT.
// Returns the number of bytes received, a multiple of PACKET_SIZE.
std::size_t receive(ProtocolEngine& engine, std::ostream& into);

std::size_t receive(std::unique_ptr<Transport> from, std::ostream& into,
                    ProgressFn progress = noop_progress);

} // namespace xmodem

#endif // XMODEM_RECEIVER_H
