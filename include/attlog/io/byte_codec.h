#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace attlog::io {

using ByteBuffer = std::vector<std::uint8_t>;

namespace bytecodec {

// Little-endian load from a raw pointer; caller guarantees bounds.
inline std::uint16_t load_u16le(const std::uint8_t* p)
{
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

inline std::uint32_t load_u32le(const std::uint8_t* p)
{
    return (std::uint32_t)p[0]
        | ((std::uint32_t)p[1] << 8)
        | ((std::uint32_t)p[2] << 16)
        | ((std::uint32_t)p[3] << 24);
}

// Bounds-checked reader over a byte span. Every read returns false and
// leaves the cursor untouched when fewer bytes remain than requested.
class Reader {
public:
    Reader(const std::uint8_t* data, std::size_t size)
        : _begin(data), _p(data), _end(data + size) {}

    explicit Reader(const ByteBuffer& buf)
        : Reader(buf.data(), buf.size()) {}

    bool read_u8(std::uint8_t& out) {
        if (remaining() < 1) return false;
        out = *_p++;
        return true;
    }

    bool read_u16le(std::uint16_t& out) {
        if (remaining() < 2) return false;
        out = load_u16le(_p);
        _p += 2;
        return true;
    }

    bool read_u32le(std::uint32_t& out) {
        if (remaining() < 4) return false;
        out = load_u32le(_p);
        _p += 4;
        return true;
    }

    bool read_bytes(const std::uint8_t*& ptr, std::size_t n) {
        if (remaining() < n) return false;
        ptr = _p;
        _p += n;
        return true;
    }

    // Fixed-width text field: view ends at the first NUL or space.
    bool read_fixed_ascii(std::string_view& out, std::size_t width) {
        const std::uint8_t* ptr = nullptr;
        if (!read_bytes(ptr, width)) return false;
        std::size_t n = 0;
        while (n < width && ptr[n] != 0 && ptr[n] != ' ') ++n;
        out = std::string_view(reinterpret_cast<const char*>(ptr), n);
        return true;
    }

    bool skip(std::size_t n) {
        if (remaining() < n) return false;
        _p += n;
        return true;
    }

    std::size_t remaining() const { return (std::size_t)(_end - _p); }
    std::size_t pos() const { return (std::size_t)(_p - _begin); }

private:
    const std::uint8_t* _begin{};
    const std::uint8_t* _p{};
    const std::uint8_t* _end{};
};

// -----------------------------
// Writer helpers
// -----------------------------

inline void write_u8(ByteBuffer& out, std::uint8_t v) {
    out.push_back(v);
}

inline void write_u16le(ByteBuffer& out, std::uint16_t v) {
    out.push_back((std::uint8_t)(v & 0xFF));
    out.push_back((std::uint8_t)((v >> 8) & 0xFF));
}

inline void write_u32le(ByteBuffer& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i)
        out.push_back((std::uint8_t)((v >> (8 * i)) & 0xFF));
}

inline void write_bytes(ByteBuffer& out, const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    out.insert(out.end(), p, p + n);
}

// Overwrite in place; caller guarantees `at + 2 <= out.size()`.
inline void store_u16le(ByteBuffer& out, std::size_t at, std::uint16_t v) {
    out[at]     = (std::uint8_t)(v & 0xFF);
    out[at + 1] = (std::uint8_t)((v >> 8) & 0xFF);
}

// Fixed-width text field, NUL padded or truncated to `width`.
inline void write_fixed_ascii(ByteBuffer& out, std::string_view s, std::size_t width) {
    for (std::size_t i = 0; i < width; ++i)
        out.push_back(i < s.size() ? (std::uint8_t)s[i] : 0);
}

} // namespace bytecodec
} // namespace attlog::io
