#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "attlog/core/status.h"
#include "attlog/device/device_time.h"
#include "attlog/io/byte_codec.h"

namespace attlog::device {

using io::ByteBuffer;

struct AttendanceRecord {
    std::uint32_t user_id{0};
    DeviceTime    timestamp{};
    std::uint8_t  verify_type{0};
    std::uint8_t  status{0};
};

bool operator==(const AttendanceRecord& a, const AttendanceRecord& b) noexcept;
bool operator!=(const AttendanceRecord& a, const AttendanceRecord& b) noexcept;

// 40-byte on-flash record layout.
namespace record_layout {
inline constexpr std::size_t SLOT_OFFSET        = 0;   // u16 internal slot, ignored
inline constexpr std::size_t USER_ID_OFFSET     = 2;
inline constexpr std::size_t USER_ID_WIDTH      = 24;  // ASCII digits, NUL/space padded
inline constexpr std::size_t VERIFY_TYPE_OFFSET = 26;
inline constexpr std::size_t TIMESTAMP_OFFSET   = 27;  // packed u32 LE
inline constexpr std::size_t STATUS_OFFSET      = 31;
inline constexpr std::size_t SIZE               = 40;
} // namespace record_layout

struct DecodeSummary {
    std::size_t decoded{0};
    std::size_t decode_errors{0};    // records skipped for a bad user id or date
    std::size_t trailing_bytes{0};   // leftover bytes short of a full record
    bool        size_prefix_stripped{false};
    bool        header_skipped{false};
};

// Decode a single 40-byte block. DecodeError on a non-numeric user id or an
// impossible calendar date.
Status decode_record(const std::uint8_t* rec, AttendanceRecord& out);

/**
 * Decode an accumulated attendance table.
 *
 * A leading u32 LE equal to the table size minus four is a size prefix and
 * is dropped. `table_size` is the size the terminal announced for the whole
 * table, which exceeds `len` when only part of it arrived; 0 means `data`
 * is the whole table. A first record whose timestamp field is all zero is a
 * placeholder and is dropped. Malformed records are counted and skipped;
 * the rest are appended to `out` in storage order.
 */
DecodeSummary decode_records(const std::uint8_t* data, std::size_t len,
                             std::vector<AttendanceRecord>& out,
                             std::size_t table_size = 0);

DecodeSummary decode_records(const ByteBuffer& data, std::vector<AttendanceRecord>& out,
                             std::size_t table_size = 0);

// Inverse of decode_record, used by simulators and tests.
void encode_record(const AttendanceRecord& rec, std::uint16_t slot, ByteBuffer& out);

} // namespace attlog::device
