#include "memory_transport.h"
#include "xmodem_error.h"

#include <algorithm>
#include <utility>

namespace xmodem {

MemoryTransport::MemoryTransport(std::vector<uint8_t> input) : input_(std::move(input)) {}

void MemoryTransport::read_exact(uint8_t* buf, std::size_t len) {
    if (len > remaining()) {
        throw XmodemError(ErrorKind::Io, "unexpected end of stream");
    }
    std::copy_n(input_.begin() + read_pos_, len, buf);
    read_pos_ += len;
}

void MemoryTransport::write_all(const uint8_t* buf, std::size_t len) {
    output_.insert(output_.end(), buf, buf + len);
}

void MemoryTransport::flush() {
    flushes_++;
}

} // namespace xmodem
