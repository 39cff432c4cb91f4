#pragma once

#include <cstdint>
#include <string>

#include "attlog/core/status.h"
#include "attlog/io/byte_stream.h"
#include "attlog/net/tcp_socket_ops.h"

namespace attlog::net {

// Independent per-operation deadlines. A read or write call must complete
// in full within its timeout.
struct StreamTimeouts {
    int connect_ms{5000};
    int read_ms{30000};
    int write_ms{10000};
};

// Blocking TCP client stream over a nonblocking socket plus poll deadlines.
class TcpByteStream final : public io::IByteStream {
public:
    explicit TcpByteStream(ITcpSocketOps& ops, StreamTimeouts timeouts = {});
    ~TcpByteStream() override;

    TcpByteStream(const TcpByteStream&) = delete;
    TcpByteStream& operator=(const TcpByteStream&) = delete;

    // Resolve and connect, trying each resolved address in turn.
    Status open(const std::string& host, std::uint16_t port);

    io::IoResult read_exact(std::uint8_t* dst, std::size_t len) override;
    io::IoResult write_all(const std::uint8_t* src, std::size_t len) override;

    void close() override;
    bool is_open() const override { return _fd >= 0; }

    // errno of the most recent failure, 0 if none.
    int last_error() const { return _last_errno; }

    const StreamTimeouts& timeouts() const { return _timeouts; }

private:
    bool connect_one(AddrInfo* ai);
    int  remaining_ms(std::uint64_t deadline);

    ITcpSocketOps& _ops;
    StreamTimeouts _timeouts;
    int _fd{-1};
    int _last_errno{0};
};

} // namespace attlog::net
