#include "receiver.h"
#include "constants.h"
#include "packet.h"
#include "xmodem_error.h"

#include <iostream>
#include <utility>

namespace xmodem {

std::size_t receive(ProtocolEngine& engine, std::ostream& into) {
    PacketBuffer packet{};
    std::size_t received = 0;

    while (true) {
        std::size_t n = 0;
        bool got = false;
        for (int attempt = 1; attempt <= MAX_ATTEMPTS && !got; ++attempt) {
            try {
                n = engine.read_packet(packet.data(), packet.size());
                got = true;
            } catch (const XmodemError& e) {
                if (!e.retryable()) throw;
                std::clog << "Retrying packet " << (int)engine.sequence_number()
                          << " (attempt " << attempt << "/" << MAX_ATTEMPTS
                          << "): " << e.what() << std::endl;
            }
        }
        if (!got) {
            engine.print_stats(std::clog);
            throw XmodemError(ErrorKind::TransferFailed, "bad receive");
        }
        if (n == 0) break;

        received += n;
        into.write(reinterpret_cast<const char*>(packet.data()), packet.size());
        if (!into) {
            throw XmodemError(ErrorKind::Io, "failed to write received data");
        }
    }

    into.flush();
    std::clog << "Transfer complete: " << received << " bytes" << std::endl;
    return received;
}

std::size_t receive(std::unique_ptr<Transport> from, std::ostream& into, ProgressFn progress) {
    ProtocolEngine engine(std::move(from), std::move(progress));
    return receive(engine, into);
}

} // namespace xmodem
