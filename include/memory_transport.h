#ifndef XMODEM_MEMORY_TRANSPORT_H
#define XMODEM_MEMORY_TRANSPORT_H

#include <vector>
#include "transport.h"

namespace xmodem {

// In-memory transport. Reads replay the bytes given at construction, writes
// are collected in output().
class MemoryTransport : public Transport {
public:
    MemoryTransport() = default;
    explicit MemoryTransport(std::vector<uint8_t> input);

    void read_exact(uint8_t* buf, std::size_t len) override;
    void write_all(const uint8_t* buf, std::size_t len) override;
    void flush() override;

    const std::vector<uint8_t>& output() const { return output_; }
    std::size_t bytes_read() const { return read_pos_; }
    std::size_t remaining() const { return input_.size() - read_pos_; }
    int flush_count() const { return flushes_; }

private:
    std::vector<uint8_t> input_;
    std::size_t read_pos_ = 0;
    std::vector<uint8_t> output_;
    int flushes_ = 0;
};

} // namespace xmodem

#endif // XMODEM_MEMORY_TRANSPORT_H
