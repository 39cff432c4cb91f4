#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "attlog/io/byte_codec.h"

namespace attlog::io {

enum class IoResult : std::uint8_t {
    Ok = 0,
    Eof,       // source ended before the request was satisfied
    Timeout,   // per-operation deadline elapsed
    Error,     // socket failure or stream not open
};

inline const char* to_string(IoResult r) noexcept
{
    switch (r) {
    case IoResult::Ok:      return "ok";
    case IoResult::Eof:     return "eof";
    case IoResult::Timeout: return "timeout";
    case IoResult::Error:   return "error";
    }
    return "?";
}

// Blocking source of bytes. read_exact either fills all `len` bytes or
// reports why it could not.
class IByteSource {
public:
    virtual ~IByteSource() = default;
    virtual IoResult read_exact(std::uint8_t* dst, std::size_t len) = 0;
};

// Blocking, bidirectional stream. Each call carries its own timeout, fixed
// by the implementation.
class IByteStream : public IByteSource {
public:
    virtual IoResult write_all(const std::uint8_t* src, std::size_t len) = 0;

    // Idempotent.
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

// In-memory source over a caller-owned buffer.
class BufferSource final : public IByteSource {
public:
    BufferSource(const std::uint8_t* data, std::size_t size)
        : _data(data), _size(size) {}

    explicit BufferSource(const ByteBuffer& buf)
        : BufferSource(buf.data(), buf.size()) {}

    IoResult read_exact(std::uint8_t* dst, std::size_t len) override
    {
        if (_size - _pos < len) {
            _pos = _size;
            return IoResult::Eof;
        }
        if (len > 0) {
            std::memcpy(dst, _data + _pos, len);
        }
        _pos += len;
        return IoResult::Ok;
    }

    std::size_t consumed() const { return _pos; }
    std::size_t remaining() const { return _size - _pos; }

private:
    const std::uint8_t* _data{};
    std::size_t _size{0};
    std::size_t _pos{0};
};

} // namespace attlog::io
