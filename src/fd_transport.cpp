#include "fd_transport.h"
#include "xmodem_error.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <termios.h>
#include <unistd.h>

namespace xmodem {

namespace {

XmodemError errno_error(const char* what) {
    if (errno == EINTR) {
        return XmodemError(ErrorKind::Interrupted, std::string(what) + " interrupted");
    }
    return XmodemError(ErrorKind::Io, std::string(what) + ": " + std::strerror(errno));
}

} // namespace

FdTransport::FdTransport(int fd, bool owns_fd) : fd_(fd), owns_fd_(owns_fd) {}

FdTransport::~FdTransport() {
    if (owns_fd_ && fd_ >= 0) {
        close(fd_);
    }
}

void FdTransport::read_exact(uint8_t* buf, std::size_t len) {
    std::size_t done = 0;
    while (done < len) {
        ssize_t n = read(fd_, buf + done, len - done);
        // Once part of the request is in, an interruption must not lose it.
        if (n < 0 && errno == EINTR && done > 0) continue;
        if (n < 0) {
            throw errno_error("read");
        }
        if (n == 0) {
            throw XmodemError(ErrorKind::Io, "unexpected end of stream");
        }
        done += static_cast<std::size_t>(n);
    }
}

void FdTransport::write_all(const uint8_t* buf, std::size_t len) {
    std::size_t done = 0;
    while (done < len) {
        ssize_t n = write(fd_, buf + done, len - done);
        if (n < 0 && errno == EINTR && done > 0) continue;
        if (n < 0) {
            throw errno_error("write");
        }
        done += static_cast<std::size_t>(n);
    }
}

void FdTransport::flush() {
    // Only terminals queue output below us; pipes and sockets have nothing to drain.
    if (isatty(fd_) && tcdrain(fd_) < 0) {
        throw errno_error("tcdrain");
    }
}

} // namespace xmodem
