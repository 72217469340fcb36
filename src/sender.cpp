#include "sender.h"
#include "constants.h"
#include "packet.h"
#include "xmodem_error.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace xmodem {

namespace {

// Fills `packet` as far as `data` allows and returns how many bytes were real.
std::size_t read_max(std::istream& data, PacketBuffer& packet) {
    data.read(reinterpret_cast<char*>(packet.data()), packet.size());
    std::size_t n = static_cast<std::size_t>(data.gcount());
    if (data.bad()) {
        throw XmodemError(ErrorKind::Io, "failed to read transfer source");
    }
    std::fill(packet.begin() + n, packet.end(), 0);
    return n;
}

} // namespace

std::size_t transmit(std::istream& data, ProtocolEngine& engine) {
    PacketBuffer packet{};
    std::size_t written = 0;

    while (true) {
        std::size_t n = read_max(data, packet);

        if (n == 0) {
            engine.write_packet(packet.data(), 0);
            engine.flush();
            std::clog << "Transfer complete: " << written << " bytes" << std::endl;
            return written;
        }

        bool sent = false;
        for (int attempt = 1; attempt <= MAX_ATTEMPTS && !sent; ++attempt) {
            try {
                engine.write_packet(packet.data(), packet.size());
                sent = true;
            } catch (const XmodemError& e) {
                if (!e.retryable()) throw;
                std::clog << "Retrying packet " << (int)engine.sequence_number()
                          << " (attempt " << attempt << "/" << MAX_ATTEMPTS
                          << "): " << e.what() << std::endl;
            }
        }
        if (!sent) {
            engine.print_stats(std::clog);
            throw XmodemError(ErrorKind::TransferFailed, "bad transmit");
        }
        written += n;
    }
}

std::size_t transmit(std::istream& data, std::unique_ptr<Transport> to, ProgressFn progress) {
    ProtocolEngine engine(std::move(to), std::move(progress));
    return transmit(data, engine);
}

} // namespace xmodem
