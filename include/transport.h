#ifndef XMODEM_TRANSPORT_H
#define XMODEM_TRANSPORT_H

#include <cstddef>
#include <cstdint>

namespace xmodem {

// Blocking byte stream the engine talks through. Implementations throw
// XmodemError (Interrupted or Io) when an operation cannot complete.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void read_exact(uint8_t* buf, std::size_t len) = 0;
    virtual void write_all(const uint8_t* buf, std::size_t len) = 0;
    virtual void flush() = 0;
};

} // namespace xmodem

#endif // XMODEM_TRANSPORT_H
