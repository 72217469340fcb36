#include "xmodem_error.h"

namespace xmodem {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BufferTooSmall:      return "buffer too small";
        case ErrorKind::InvalidProtocolByte: return "invalid protocol byte";
        case ErrorKind::ChecksumMismatch:    return "checksum mismatch";
        case ErrorKind::Aborted:             return "aborted";
        case ErrorKind::TransferFailed:      return "transfer failed";
        case ErrorKind::Interrupted:         return "interrupted";
        case ErrorKind::Io:                  return "i/o error";
    }
    return "unknown error";
}

XmodemError::XmodemError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

bool XmodemError::retryable() const {
    return kind_ == ErrorKind::ChecksumMismatch || kind_ == ErrorKind::Interrupted;
}

} // namespace xmodem
