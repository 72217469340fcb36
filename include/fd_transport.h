#ifndef XMODEM_FD_TRANSPORT_H
#define XMODEM_FD_TRANSPORT_H

#include "transport.h"

namespace xmodem {

// Transport over a POSIX descriptor: serial line, pipe or socket.
class FdTransport : public Transport {
public:
    explicit FdTransport(int fd, bool owns_fd = false);
    ~FdTransport() override;

    FdTransport(const FdTransport&) = delete;
    FdTransport& operator=(const FdTransport&) = delete;

    void read_exact(uint8_t* buf, std::size_t len) override;
    void write_all(const uint8_t* buf, std::size_t len) override;
    void flush() override;

private:
    int fd_;
    bool owns_fd_;
};

} // namespace xmodem

#endif // XMODEM_FD_TRANSPORT_H
