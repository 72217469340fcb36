#ifndef XMODEM_ERROR_H
#define XMODEM_ERROR_H

#include <stdexcept>
#include <string>

namespace xmodem {

enum class ErrorKind {
    BufferTooSmall,      // caller passed a malformed buffer
    InvalidProtocolByte, // peer sent an unexpected control byte
    ChecksumMismatch,    // packet must be sent again
    Aborted,             // peer sent CAN
    TransferFailed,      // retry budget exhausted
    Interrupted,         // transient transport condition
    Io                   // any other transport or stream failure
};

const char* to_string(ErrorKind kind);

class XmodemError : public std::runtime_error {
public:
    XmodemError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

    // True for the conditions the transfer driver retries.
    bool retryable() const;

private:
    ErrorKind kind_;
};

} // namespace xmodem

#endif // XMODEM_ERROR_H
