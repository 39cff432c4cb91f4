#include "attlog/protocol/packet.h"

#include "attlog/core/logging.h"
#include "attlog/protocol/command_ids.h"

#include <cstddef>   // offsetof
#include <cstring>   // std::memcmp
#include <string>

namespace attlog::protocol {

static constexpr const char* TAG = "packet";

// On-wire inner header layout (must stay exactly this size/layout)
struct InnerHeader {
    std::uint16_t command;
    std::uint16_t checksum;
    std::uint16_t session_id;
    std::uint16_t reply_id;
};

static_assert(sizeof(InnerHeader) == INNER_HEADER_SIZE, "InnerHeader must be 8 bytes");
static_assert(offsetof(InnerHeader, checksum) == 2, "checksum offset mismatch");
static_assert(offsetof(InnerHeader, reply_id) == 6, "reply_id offset mismatch");

const char* to_string(FrameError e) noexcept
{
    switch (e) {
    case FrameError::None:        return "None";
    case FrameError::Closed:      return "Closed";
    case FrameError::BadMagic:    return "BadMagic";
    case FrameError::Truncated:   return "Truncated";
    case FrameError::ShortHeader: return "ShortHeader";
    case FrameError::Oversized:   return "Oversized";
    case FrameError::Timeout:     return "Timeout";
    case FrameError::IoError:     return "IoError";
    }
    return "?";
}

Status frame_status(FrameError e)
{
    switch (e) {
    case FrameError::None:
        return Status::ok();
    case FrameError::Timeout:
        return Status{StatusCode::TransportError, "read timed out"};
    case FrameError::IoError:
        return Status{StatusCode::TransportError, "read failed"};
    case FrameError::Closed:
        return Status{StatusCode::TransportError, "connection closed by peer"};
    default:
        return Status{StatusCode::ProtocolError, to_string(e)};
    }
}

std::uint16_t compute_checksum(std::uint16_t command,
                               std::uint16_t session_id,
                               std::uint16_t reply_id,
                               const std::uint8_t* data,
                               std::size_t len)
{
    std::uint32_t sum = static_cast<std::uint32_t>(command)
                      + static_cast<std::uint32_t>(session_id)
                      + static_cast<std::uint32_t>(reply_id);

    std::size_t i = 0;
    for (; i + 1 < len; i += 2) {
        sum += io::bytecodec::load_u16le(data + i);
        sum = (sum & 0xFFFFu) + (sum >> 16); // fold carry
    }
    if (i < len) {
        sum += data[i];
    }

    while (sum > 0xFFFFu) {
        sum = (sum & 0xFFFFu) + (sum >> 16);
    }

    return static_cast<std::uint16_t>(~sum & 0xFFFFu);
}

bool verify_checksum(const InnerMessage& msg)
{
    return msg.checksum == compute_checksum(msg.command, msg.session_id, msg.reply_id,
                                            msg.data.data(), msg.data.size());
}

ByteBuffer encode(std::uint16_t command,
                  std::uint16_t session_id,
                  std::uint16_t reply_id,
                  const std::uint8_t* data,
                  std::size_t len)
{
    using namespace io::bytecodec;

    ByteBuffer out;
    out.reserve(OUTER_HEADER_SIZE + INNER_HEADER_SIZE + len);

    write_bytes(out, PACKET_MAGIC, sizeof(PACKET_MAGIC));
    write_u32le(out, static_cast<std::uint32_t>(INNER_HEADER_SIZE + len));

    const std::size_t inner = out.size();
    write_u16le(out, command);
    write_u16le(out, 0); // checksum placeholder
    write_u16le(out, session_id);
    write_u16le(out, reply_id);
    if (len > 0) {
        write_bytes(out, data, len);
    }

    store_u16le(out, inner + offsetof(InnerHeader, checksum),
                compute_checksum(command, session_id, reply_id, data, len));
    return out;
}

ByteBuffer encode(std::uint16_t command,
                  std::uint16_t session_id,
                  std::uint16_t reply_id,
                  const ByteBuffer& data)
{
    return encode(command, session_id, reply_id, data.data(), data.size());
}

static FrameError from_io(io::IoResult r)
{
    switch (r) {
    case io::IoResult::Ok:      return FrameError::None;
    case io::IoResult::Eof:     return FrameError::Truncated;
    case io::IoResult::Timeout: return FrameError::Timeout;
    case io::IoResult::Error:   return FrameError::IoError;
    }
    return FrameError::IoError;
}

FrameError decode(io::IByteSource& src, InnerMessage& out)
{
    std::uint8_t hdr[OUTER_HEADER_SIZE];

    // End of stream before the first byte is a hang-up, not a short packet.
    const io::IoResult first = src.read_exact(hdr, 1);
    if (first == io::IoResult::Eof) {
        return FrameError::Closed;
    }
    FrameError err = from_io(first);
    if (err == FrameError::None) {
        err = from_io(src.read_exact(hdr + 1, sizeof(hdr) - 1));
    }
    if (err != FrameError::None) {
        return err;
    }

    if (std::memcmp(hdr, PACKET_MAGIC, sizeof(PACKET_MAGIC)) != 0) {
        AL_LOGW(TAG, "bad magic %02x %02x %02x %02x", hdr[0], hdr[1], hdr[2], hdr[3]);
        return FrameError::BadMagic;
    }

    const std::uint32_t payload_len = io::bytecodec::load_u32le(hdr + 4);
    if (payload_len < INNER_HEADER_SIZE) {
        AL_LOGW(TAG, "payload length %u shorter than inner header", (unsigned)payload_len);
        return FrameError::ShortHeader;
    }
    if (payload_len > MAX_PAYLOAD_SIZE) {
        AL_LOGW(TAG, "payload length %u exceeds limit", (unsigned)payload_len);
        return FrameError::Oversized;
    }

    ByteBuffer payload(payload_len);
    err = from_io(src.read_exact(payload.data(), payload.size()));
    if (err != FrameError::None) {
        return err;
    }

    io::bytecodec::Reader r(payload);
    r.read_u16le(out.command);
    r.read_u16le(out.checksum);
    r.read_u16le(out.session_id);
    r.read_u16le(out.reply_id);
    out.data.assign(payload.begin() + INNER_HEADER_SIZE, payload.end());

    out.checksum_valid = verify_checksum(out);
    if (!out.checksum_valid) {
        AL_LOGW(TAG, "checksum mismatch on %s (reply %u): got 0x%04x",
                command_name(out.command), (unsigned)out.reply_id, (unsigned)out.checksum);
    }

    return FrameError::None;
}

} // namespace attlog::protocol
