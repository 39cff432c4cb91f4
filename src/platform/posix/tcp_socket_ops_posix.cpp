#include "attlog/net/tcp_socket_ops.h"
#include "attlog/platform/tcp_socket_ops.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

namespace attlog::net {

namespace {

const struct addrinfo* as_ai(AddrInfo* ai)
{
    return reinterpret_cast<const struct addrinfo*>(ai);
}

int wait_for(int fd, short events, int timeout_ms)
{
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = events;

    // POLLERR/POLLHUP also count as ready; the following call reports them.
    return ::poll(&pfd, 1, timeout_ms);
}

} // namespace

class PosixTcpSocketOps final : public ITcpSocketOps {
public:
    int socket(int domain, int type, int protocol) override
    {
        return ::socket(domain, type, protocol);
    }

    void close(int fd) override
    {
        if (fd >= 0) {
            ::close(fd);
        }
    }

    int connect(int fd, const struct sockaddr* addr, SockLen addrlen) override
    {
        return ::connect(fd, addr, static_cast<socklen_t>(addrlen));
    }

    int set_nonblocking(int fd) override
    {
        const int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0) return -1;
        return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    int wait_readable(int fd, int timeout_ms) override
    {
        return wait_for(fd, POLLIN, timeout_ms);
    }

    int wait_writable(int fd, int timeout_ms) override
    {
        return wait_for(fd, POLLOUT, timeout_ms);
    }

    SSize send(int fd, const void* buf, std::size_t len) override
    {
        return ::send(fd, buf, len, MSG_DONTWAIT | MSG_NOSIGNAL);
    }

    SSize recv(int fd, void* buf, std::size_t len) override
    {
        return ::recv(fd, buf, len, MSG_DONTWAIT);
    }

    int get_so_error(int fd) override
    {
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
            return errno;
        }
        return err;
    }

    void apply_stream_socket_options(int fd, bool nodelay, bool keepalive) override
    {
        const int on = 1;
        if (nodelay) {
            (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));
        }
        if (keepalive) {
            (void)::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
        }
    }

    int getaddrinfo(const char* host, const char* port, AddrInfo** out) override
    {
        struct addrinfo hints {};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;

        struct addrinfo* res = nullptr;
        const int gai = ::getaddrinfo(host, port, &hints, &res);
        *out = (gai == 0) ? reinterpret_cast<AddrInfo*>(res) : nullptr;
        return gai;
    }

    void freeaddrinfo(AddrInfo* ai) override
    {
        if (ai) {
            ::freeaddrinfo(reinterpret_cast<struct addrinfo*>(ai));
        }
    }

    AddrInfo* addrinfo_next(AddrInfo* ai) override
    {
        if (!ai) return nullptr;
        return reinterpret_cast<AddrInfo*>(as_ai(ai)->ai_next);
    }

    int addrinfo_family(AddrInfo* ai) override
    {
        return ai ? as_ai(ai)->ai_family : 0;
    }

    int addrinfo_socktype(AddrInfo* ai) override
    {
        return ai ? as_ai(ai)->ai_socktype : 0;
    }

    int addrinfo_protocol(AddrInfo* ai) override
    {
        return ai ? as_ai(ai)->ai_protocol : 0;
    }

    const struct sockaddr* addrinfo_addr(AddrInfo* ai, SockLen* out_len) override
    {
        if (!ai) return nullptr;
        if (out_len) {
            *out_len = static_cast<SockLen>(as_ai(ai)->ai_addrlen);
        }
        return as_ai(ai)->ai_addr;
    }

    std::uint64_t now_ms() override
    {
        struct timespec ts {};
        ::clock_gettime(CLOCK_MONOTONIC, &ts);
        return static_cast<std::uint64_t>(ts.tv_sec) * 1000ULL +
               static_cast<std::uint64_t>(ts.tv_nsec) / 1000000ULL;
    }

    int last_errno() override
    {
        return errno;
    }

    const char* err_string(int errno_val) override
    {
        return std::strerror(errno_val);
    }

    bool is_would_block(int errno_val) const noexcept override
    {
        return errno_val == EWOULDBLOCK || errno_val == EAGAIN;
    }

    bool is_in_progress(int errno_val) const noexcept override
    {
        return errno_val == EINPROGRESS || errno_val == EALREADY;
    }

    bool is_interrupted(int errno_val) const noexcept override
    {
        return errno_val == EINTR;
    }

    bool is_peer_gone(int errno_val) const noexcept override
    {
        return errno_val == ECONNRESET || errno_val == ENOTCONN || errno_val == EPIPE;
    }

    int err_timed_out() const noexcept override
    {
        return ETIMEDOUT;
    }
};

static PosixTcpSocketOps g_posix_socket_ops;

} // namespace attlog::net

namespace attlog::platform {

attlog::net::ITcpSocketOps& default_tcp_socket_ops()
{
    return attlog::net::g_posix_socket_ops;
}

} // namespace attlog::platform
