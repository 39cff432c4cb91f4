#include "attlog/device/session.h"

#include "attlog/core/logging.h"

#include <utility>

namespace attlog::device {

static constexpr const char* TAG = "session";

using protocol::command_name;
using protocol::to_wire;

Session::Session(std::unique_ptr<io::IByteStream> stream)
    : _stream(std::move(stream))
{
}

Session::~Session()
{
    disconnect();
}

Status Session::connect(net::ITcpSocketOps& ops,
                        const std::string& host,
                        std::uint16_t port,
                        const net::StreamTimeouts& timeouts,
                        std::unique_ptr<Session>& out)
{
    auto tcp = std::make_unique<net::TcpByteStream>(ops, timeouts);
    Status st = tcp->open(host, port);
    if (!st) {
        return st;
    }

    auto session = std::make_unique<Session>(std::move(tcp));
    st = session->handshake();
    if (!st) {
        return st;
    }

    out = std::move(session);
    return Status::ok();
}

ConnectionDiagnosis Session::diagnose(net::ITcpSocketOps& ops,
                                     const std::string& host,
                                     std::uint16_t port,
                                     const net::StreamTimeouts& timeouts)
{
    ConnectionDiagnosis diag;

    auto tcp = std::make_unique<net::TcpByteStream>(ops, timeouts);
    const std::uint64_t started = ops.now_ms();
    Status st = tcp->open(host, port);
    diag.tcp_connect_ms = ops.now_ms() - started;
    if (!st) {
        diag.tcp_error = st.describe();
        return diag;
    }
    diag.tcp_reachable = true;

    Session session(std::move(tcp));
    const std::uint64_t handshake_started = ops.now_ms();
    st = session.handshake();
    diag.handshake_ms = ops.now_ms() - handshake_started;
    diag.reply_command = session.connect_reply();
    if (!st) {
        diag.protocol_error = st.describe();
        return diag;
    }

    diag.protocol_ok = true;
    diag.session_id = session.session_id();
    session.disconnect();

    AL_LOGI(TAG, "%s:%u reachable in %u ms, session %u",
            host.c_str(), (unsigned)port, (unsigned)diag.tcp_connect_ms, (unsigned)diag.session_id);
    return diag;
}

Status Session::write_request(std::uint16_t cmd, std::uint16_t reply_id,
                              const std::uint8_t* data, std::size_t len)
{
    const ByteBuffer pkt = protocol::encode(cmd, _session_id, reply_id, data, len);

    AL_LOGV(TAG, "-> %s session=%u reply=%u len=%u",
            command_name(cmd), (unsigned)_session_id, (unsigned)reply_id, (unsigned)len);

    const io::IoResult r = _stream->write_all(pkt.data(), pkt.size());
    if (r != io::IoResult::Ok) {
        return Status{StatusCode::TransportError,
                      std::string("write ") + command_name(cmd) + ": " + io::to_string(r)};
    }
    return Status::ok();
}

protocol::FrameError Session::read_response(InnerMessage& reply)
{
    const protocol::FrameError fe = protocol::decode(*_stream, reply);
    if (fe == protocol::FrameError::None) {
        AL_LOGV(TAG, "<- %s session=%u reply=%u len=%u",
                command_name(reply.command), (unsigned)reply.session_id,
                (unsigned)reply.reply_id, (unsigned)reply.data.size());
    }
    return fe;
}

bool Session::can_write() const
{
    return _handshaken && !_disconnected && _stream && _stream->is_open();
}

void Session::mark_broken(const Status& why)
{
    if (!_broken) {
        AL_LOGW(TAG, "session %u broken: %s", (unsigned)_session_id, why.describe().c_str());
    }
    _broken = true;
}

Status Session::handshake()
{
    if (!_stream || !_stream->is_open()) {
        return Status{StatusCode::TransportError, "stream not open"};
    }

    _session_id = 0;
    _reply_counter = 0;
    _connect_reply = 0;

    Status st = write_request(to_wire(Command::Connect), 0, nullptr, 0);
    InnerMessage reply;
    if (st) {
        st = protocol::frame_status(read_response(reply));
    }
    if (!st) {
        AL_LOGE(TAG, "connect handshake failed: %s", st.describe().c_str());
        _stream->close();
        return st;
    }

    _connect_reply = reply.command;

    if (protocol::is(reply.command, Command::AckUnauth)) {
        _stream->close();
        return Status{StatusCode::ProtocolError, "terminal requires a comm key"};
    }
    if (protocol::is(reply.command, Command::AckError)) {
        _stream->close();
        return Status{StatusCode::ProtocolError, "terminal rejected connect"};
    }

    _session_id = reply.session_id;
    _reply_counter = 0;
    _handshaken = true;
    _broken = false;
    _disconnected = false;

    AL_LOGI(TAG, "session %u established", (unsigned)_session_id);
    return Status::ok();
}

Status Session::send(Command cmd, const std::uint8_t* data, std::size_t len, InnerMessage& reply)
{
    if (!connected()) {
        return Status{StatusCode::TransportError,
                      std::string("session not connected, cannot send ") + command_name(to_wire(cmd))};
    }

    ++_reply_counter;

    Status st = write_request(to_wire(cmd), _reply_counter, data, len);
    if (st) {
        st = protocol::frame_status(read_response(reply));
    }
    if (!st) {
        mark_broken(st);
    }
    return st;
}

Status Session::send_best_effort(Command cmd, InnerMessage& reply)
{
    if (!can_write()) {
        return Status{StatusCode::TransportError,
                      std::string("socket closed, cannot send ") + command_name(to_wire(cmd))};
    }

    ++_reply_counter;

    Status st = write_request(to_wire(cmd), _reply_counter, nullptr, 0);
    if (!st) {
        mark_broken(st);
        return st;
    }

    const protocol::FrameError fe = read_response(reply);
    st = protocol::frame_status(fe);
    if (!st && fe != protocol::FrameError::Timeout) {
        mark_broken(st);
    }
    return st;
}

Status Session::send(Command cmd, const ByteBuffer& data, InnerMessage& reply)
{
    return send(cmd, data.data(), data.size(), reply);
}

Status Session::send(Command cmd, InnerMessage& reply)
{
    return send(cmd, nullptr, 0, reply);
}

Status Session::receive(InnerMessage& reply)
{
    if (!connected()) {
        return Status{StatusCode::TransportError, "session not connected, cannot receive"};
    }

    const Status st = protocol::frame_status(read_response(reply));
    if (!st) {
        mark_broken(st);
    }
    return st;
}

void Session::disconnect()
{
    if (_disconnected) {
        return;
    }
    if (!_stream) {
        _disconnected = true;
        return;
    }

    if (can_write()) {
        InnerMessage reply;
        const Status st = send_best_effort(Command::Exit, reply);
        if (!st) {
            AL_LOGD(TAG, "exit not acknowledged (%s), closing anyway", st.describe().c_str());
        }
    }

    _disconnected = true;
    _stream->close();
    AL_LOGI(TAG, "session %u closed", (unsigned)_session_id);
}

} // namespace attlog::device
