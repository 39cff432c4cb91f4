#pragma once

#include <cstdint>
#include <cstddef>

// Forward declarations only - no platform headers
struct sockaddr;

namespace attlog::net {

using SockLen = std::uint32_t;
using SSize = std::ptrdiff_t;

// Address resolution result (opaque handle)
struct AddrInfo;

// Platform-agnostic socket operations for a blocking-with-deadline TCP
// client. Implementations provide the syscall glue.
class ITcpSocketOps {
public:
    virtual ~ITcpSocketOps() = default;

    // Returns socket fd on success, < 0 on error (errno set).
    virtual int socket(int domain, int type, int protocol) = 0;

    // Safe to call on an invalid fd.
    virtual void close(int fd) = 0;

    // Returns 0 on immediate success, -1 with errno=EINPROGRESS if async.
    virtual int connect(int fd, const struct sockaddr* addr, SockLen addrlen) = 0;

    virtual int set_nonblocking(int fd) = 0;

    // Wait up to timeout_ms for the fd to become readable / writable.
    // Returns > 0 when ready, 0 on timeout, < 0 on error (errno set).
    virtual int wait_readable(int fd, int timeout_ms) = 0;
    virtual int wait_writable(int fd, int timeout_ms) = 0;

    // Nonblocking send/recv with the platform's no-signal flags applied.
    // send: bytes sent (>0) or -1. recv: bytes (>0), 0 on EOF, -1 on error.
    virtual SSize send(int fd, const void* buf, std::size_t len) = 0;
    virtual SSize recv(int fd, void* buf, std::size_t len) = 0;

    // SO_ERROR value, 0 if none.
    virtual int get_so_error(int fd) = 0;

    // Common code must not assume TCP_NODELAY/SO_KEEPALIVE numeric values.
    virtual void apply_stream_socket_options(int fd, bool nodelay, bool keepalive) = 0;

    // Resolve host and port. Returns 0 on success; free *out with freeaddrinfo.
    virtual int getaddrinfo(const char* host, const char* port, AddrInfo** out) = 0;
    virtual void freeaddrinfo(AddrInfo* ai) = 0;
    virtual AddrInfo* addrinfo_next(AddrInfo* ai) = 0;
    virtual int addrinfo_family(AddrInfo* ai) = 0;
    virtual int addrinfo_socktype(AddrInfo* ai) = 0;
    virtual int addrinfo_protocol(AddrInfo* ai) = 0;
    virtual const struct sockaddr* addrinfo_addr(AddrInfo* ai, SockLen* out_len) = 0;

    // Monotonic time in milliseconds (for deadlines).
    virtual std::uint64_t now_ms() = 0;

    virtual int last_errno() = 0;
    virtual const char* err_string(int errno_val) = 0;

    virtual bool is_would_block(int errno_val) const noexcept = 0;
    virtual bool is_in_progress(int errno_val) const noexcept = 0;
    virtual bool is_interrupted(int errno_val) const noexcept = 0;
    virtual bool is_peer_gone(int errno_val) const noexcept = 0;

    virtual int err_timed_out() const noexcept = 0;
};

} // namespace attlog::net
