#pragma once

#include <cstddef>
#include <cstdint>

#include "attlog/core/status.h"
#include "attlog/io/byte_codec.h"
#include "attlog/io/byte_stream.h"

namespace attlog::protocol {

using io::ByteBuffer;

// Outer packet: magic, u32 LE payload length, payload (the inner message).
inline constexpr std::uint8_t PACKET_MAGIC[4] = {0x50, 0x50, 0x82, 0x7D};
inline constexpr std::size_t  OUTER_HEADER_SIZE = 8;

// Inner message header: command, checksum, session id, reply id (u16 LE each).
inline constexpr std::size_t  INNER_HEADER_SIZE = 8;

// Sanity bound on a single payload; a chunk response is at most
// MAX_CHUNK plus the inner header.
inline constexpr std::uint32_t MAX_PAYLOAD_SIZE = 1024u * 1024u;

enum class FrameError : std::uint8_t {
    None = 0,
    Closed,        // stream ended cleanly before a new packet
    BadMagic,
    Truncated,     // source ended mid-packet
    ShortHeader,   // payload_len smaller than the inner header
    Oversized,     // payload_len above MAX_PAYLOAD_SIZE
    Timeout,
    IoError,
};

const char* to_string(FrameError e) noexcept;

// Framing failures are ProtocolError; I/O failures and a connection
// closed between packets are TransportError.
Status frame_status(FrameError e);

struct InnerMessage {
    std::uint16_t command{0};
    std::uint16_t checksum{0};
    std::uint16_t session_id{0};
    std::uint16_t reply_id{0};
    ByteBuffer    data;

    // Filled by decode() only. Inbound checksums are advisory.
    bool checksum_valid{true};
};

/**
 * One's-complement checksum over {command, session_id, reply_id, data}.
 *
 * Little-endian 16-bit words are summed; an odd trailing data byte counts as
 * a word of its own. Carries above bit 15 are folded back in until none
 * remain, then the sum is inverted.
 */
std::uint16_t compute_checksum(std::uint16_t command,
                               std::uint16_t session_id,
                               std::uint16_t reply_id,
                               const std::uint8_t* data,
                               std::size_t len);

bool verify_checksum(const InnerMessage& msg);

// Build a complete outer packet ready for the wire.
ByteBuffer encode(std::uint16_t command,
                  std::uint16_t session_id,
                  std::uint16_t reply_id,
                  const std::uint8_t* data,
                  std::size_t len);

ByteBuffer encode(std::uint16_t command,
                  std::uint16_t session_id,
                  std::uint16_t reply_id,
                  const ByteBuffer& data);

// Read exactly one outer packet from `src`. A checksum mismatch is logged
// and reported through `out.checksum_valid`, never as an error.
FrameError decode(io::IByteSource& src, InnerMessage& out);

} // namespace attlog::protocol
