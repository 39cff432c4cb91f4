#include "attlog/net/tcp_byte_stream.h"

#include "attlog/core/logging.h"

#include <string>

namespace attlog::net {

static constexpr const char* TAG = "tcp";

TcpByteStream::TcpByteStream(ITcpSocketOps& ops, StreamTimeouts timeouts)
    : _ops(ops)
    , _timeouts(timeouts)
{
}

TcpByteStream::~TcpByteStream()
{
    close();
}

void TcpByteStream::close()
{
    if (_fd >= 0) {
        _ops.close(_fd);
        _fd = -1;
    }
}

int TcpByteStream::remaining_ms(std::uint64_t deadline)
{
    const std::uint64_t now = _ops.now_ms();
    return now >= deadline ? 0 : static_cast<int>(deadline - now);
}

bool TcpByteStream::connect_one(AddrInfo* ai)
{
    const int fd = _ops.socket(_ops.addrinfo_family(ai),
                               _ops.addrinfo_socktype(ai),
                               _ops.addrinfo_protocol(ai));
    if (fd < 0) {
        _last_errno = _ops.last_errno();
        return false;
    }

    if (_ops.set_nonblocking(fd) != 0) {
        _last_errno = _ops.last_errno();
        _ops.close(fd);
        return false;
    }
    _ops.apply_stream_socket_options(fd, true, true);

    SockLen addrlen = 0;
    const struct sockaddr* addr = _ops.addrinfo_addr(ai, &addrlen);
    if (_ops.connect(fd, addr, addrlen) == 0) {
        _fd = fd;
        return true;
    }

    const int err = _ops.last_errno();
    if (!_ops.is_in_progress(err) && !_ops.is_would_block(err)) {
        _last_errno = err;
        _ops.close(fd);
        return false;
    }

    const std::uint64_t deadline = _ops.now_ms() + static_cast<std::uint64_t>(_timeouts.connect_ms);
    for (;;) {
        const int ready = _ops.wait_writable(fd, remaining_ms(deadline));
        if (ready > 0) {
            break;
        }
        if (ready < 0 && _ops.is_interrupted(_ops.last_errno())) {
            continue;
        }
        _last_errno = (ready == 0) ? _ops.err_timed_out() : _ops.last_errno();
        _ops.close(fd);
        return false;
    }

    const int so_err = _ops.get_so_error(fd);
    if (so_err != 0) {
        _last_errno = so_err;
        _ops.close(fd);
        return false;
    }

    _fd = fd;
    return true;
}

Status TcpByteStream::open(const std::string& host, std::uint16_t port)
{
    close();
    _last_errno = 0;

    if (host.empty() || port == 0) {
        return Status{StatusCode::InvalidArgument, "host and port are required"};
    }

    const std::string portStr = std::to_string(port);
    AddrInfo* res = nullptr;
    const int gai = _ops.getaddrinfo(host.c_str(), portStr.c_str(), &res);
    if (gai != 0 || !res) {
        if (res) _ops.freeaddrinfo(res);
        AL_LOGE(TAG, "cannot resolve %s:%u", host.c_str(), (unsigned)port);
        return Status{StatusCode::TransportError, "cannot resolve " + host};
    }

    for (AddrInfo* ai = res; ai; ai = _ops.addrinfo_next(ai)) {
        if (connect_one(ai)) {
            break;
        }
    }
    _ops.freeaddrinfo(res);

    if (_fd < 0) {
        AL_LOGE(TAG, "connect %s:%u failed: %s (errno=%d)",
                host.c_str(), (unsigned)port, _ops.err_string(_last_errno), _last_errno);
        return Status{StatusCode::TransportError,
                      "connect " + host + ":" + portStr + ": " + _ops.err_string(_last_errno)};
    }

    AL_LOGI(TAG, "connected to %s:%u", host.c_str(), (unsigned)port);
    return Status::ok();
}

io::IoResult TcpByteStream::read_exact(std::uint8_t* dst, std::size_t len)
{
    if (_fd < 0) {
        return io::IoResult::Error;
    }

    const std::uint64_t deadline = _ops.now_ms() + static_cast<std::uint64_t>(_timeouts.read_ms);
    std::size_t got = 0;

    while (got < len) {
        const SSize n = _ops.recv(_fd, dst + got, len - got);
        if (n > 0) {
            got += static_cast<std::size_t>(n);
            continue;
        }
        if (n == 0) {
            AL_LOGW(TAG, "peer closed connection after %u of %u bytes",
                    (unsigned)got, (unsigned)len);
            return io::IoResult::Eof;
        }

        const int err = _ops.last_errno();
        if (_ops.is_interrupted(err)) {
            continue;
        }
        if (_ops.is_peer_gone(err)) {
            AL_LOGW(TAG, "TCP peer reset connection (%s, errno=%d)",
                    _ops.err_string(err), err);
            _last_errno = err;
            return io::IoResult::Error;
        }
        if (!_ops.is_would_block(err)) {
            _last_errno = err;
            AL_LOGE(TAG, "recv failed: %s (errno=%d)", _ops.err_string(err), err);
            return io::IoResult::Error;
        }

        const int wait = remaining_ms(deadline);
        if (wait <= 0) {
            _last_errno = _ops.err_timed_out();
            return io::IoResult::Timeout;
        }
        const int ready = _ops.wait_readable(_fd, wait);
        if (ready == 0) {
            _last_errno = _ops.err_timed_out();
            return io::IoResult::Timeout;
        }
        if (ready < 0 && !_ops.is_interrupted(_ops.last_errno())) {
            _last_errno = _ops.last_errno();
            return io::IoResult::Error;
        }
    }

    return io::IoResult::Ok;
}

io::IoResult TcpByteStream::write_all(const std::uint8_t* src, std::size_t len)
{
    if (_fd < 0) {
        return io::IoResult::Error;
    }

    const std::uint64_t deadline = _ops.now_ms() + static_cast<std::uint64_t>(_timeouts.write_ms);
    std::size_t sent = 0;

    while (sent < len) {
        const SSize n = _ops.send(_fd, src + sent, len - sent);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }

        const int err = _ops.last_errno();
        if (n < 0 && _ops.is_interrupted(err)) {
            continue;
        }
        if (n < 0 && !_ops.is_would_block(err)) {
            _last_errno = err;
            AL_LOGE(TAG, "send failed: %s (errno=%d)", _ops.err_string(err), err);
            return io::IoResult::Error;
        }

        const int wait = remaining_ms(deadline);
        if (wait <= 0) {
            _last_errno = _ops.err_timed_out();
            return io::IoResult::Timeout;
        }
        const int ready = _ops.wait_writable(_fd, wait);
        if (ready == 0) {
            _last_errno = _ops.err_timed_out();
            return io::IoResult::Timeout;
        }
        if (ready < 0 && !_ops.is_interrupted(_ops.last_errno())) {
            _last_errno = _ops.last_errno();
            return io::IoResult::Error;
        }
    }

    return io::IoResult::Ok;
}

} // namespace attlog::net
