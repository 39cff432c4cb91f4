#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "attlog/core/status.h"
#include "attlog/io/byte_stream.h"
#include "attlog/net/tcp_byte_stream.h"
#include "attlog/net/tcp_socket_ops.h"
#include "attlog/protocol/command_ids.h"
#include "attlog/protocol/packet.h"

namespace attlog::device {

using io::ByteBuffer;
using protocol::Command;
using protocol::InnerMessage;

// Outcome of a connect-only check of a terminal.
struct ConnectionDiagnosis {
    bool          tcp_reachable{false};
    std::uint64_t tcp_connect_ms{0};
    std::string   tcp_error;

    bool          protocol_ok{false};     // handshake accepted
    std::string   protocol_error;
    std::uint16_t session_id{0};
    std::uint16_t reply_command{0};       // tag of the connect reply, 0 if none
    std::uint64_t handshake_ms{0};
};

/**
 * One half-duplex conversation with a terminal.
 *
 * The session owns its byte stream and is owned by exactly one transfer.
 * The terminal assigns the session id in its reply to Connect; every later
 * request carries that id and the next value of a 16-bit reply counter
 * (wrapping at 2^16).
 *
 * Any transport or framing failure leaves the stream at an unknown packet
 * boundary, so the session marks itself broken and refuses further
 * requests other than best-effort cleanup. disconnect() is idempotent and
 * runs from the destructor.
 */
class Session {
public:
    explicit Session(std::unique_ptr<io::IByteStream> stream);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Open a TCP connection and perform the connect handshake.
    static Status connect(net::ITcpSocketOps& ops,
                          const std::string& host,
                          std::uint16_t port,
                          const net::StreamTimeouts& timeouts,
                          std::unique_ptr<Session>& out);

    // Connect, handshake and say goodbye, recording how far it got.
    static ConnectionDiagnosis diagnose(net::ITcpSocketOps& ops,
                                        const std::string& host,
                                        std::uint16_t port,
                                        const net::StreamTimeouts& timeouts);

    // Connect handshake over the already-open stream: sends Connect with
    // session 0 / reply 0 and adopts the session id from the reply header.
    Status handshake();

    // Increment the reply counter, send one request and read exactly one
    // response. No retry.
    Status send(Command cmd, const std::uint8_t* data, std::size_t len, InnerMessage& reply);
    Status send(Command cmd, const ByteBuffer& data, InnerMessage& reply);
    Status send(Command cmd, InnerMessage& reply);

    // Cleanup-path variant of send(): also attempted on a broken session as
    // long as the socket is open, and a read timeout does not break the
    // session.
    Status send_best_effort(Command cmd, InnerMessage& reply);

    // Read one further packet without sending anything.
    Status receive(InnerMessage& reply);

    // Best-effort Exit, then close. Safe to call repeatedly.
    void disconnect();

    bool connected() const { return _handshaken && !_broken && !_disconnected; }
    bool broken() const { return _broken; }
    bool disconnected() const { return _disconnected; }

    std::uint16_t session_id() const { return _session_id; }

    // Reply id carried by the most recent request.
    std::uint16_t reply_id() const { return _reply_counter; }

    // Command tag of the last connect reply, 0 if none arrived.
    std::uint16_t connect_reply() const { return _connect_reply; }

private:
    Status write_request(std::uint16_t cmd, std::uint16_t reply_id,
                         const std::uint8_t* data, std::size_t len);
    protocol::FrameError read_response(InnerMessage& reply);
    bool   can_write() const;
    void   mark_broken(const Status& why);

    std::unique_ptr<io::IByteStream> _stream;
    std::uint16_t _session_id{0};
    std::uint16_t _reply_counter{0};
    std::uint16_t _connect_reply{0};
    bool _handshaken{false};
    bool _broken{false};
    bool _disconnected{false};
};

} // namespace attlog::device
