#include "attlog/device/record_decoder.h"

#include "attlog/core/logging.h"

#include <charconv>
#include <string>
#include <string_view>

namespace attlog::device {

static constexpr const char* TAG = "records";

namespace layout = record_layout;

bool operator==(const AttendanceRecord& a, const AttendanceRecord& b) noexcept
{
    return a.user_id == b.user_id
        && a.timestamp == b.timestamp
        && a.verify_type == b.verify_type
        && a.status == b.status;
}

bool operator!=(const AttendanceRecord& a, const AttendanceRecord& b) noexcept
{
    return !(a == b);
}

static bool parse_user_id(std::string_view s, std::uint32_t& out)
{
    if (s.empty()) return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    const auto res = std::from_chars(first, last, out, 10);
    return res.ec == std::errc() && res.ptr == last;
}

Status decode_record(const std::uint8_t* rec, AttendanceRecord& out)
{
    io::bytecodec::Reader r(rec, layout::SIZE);
    r.skip(layout::USER_ID_OFFSET);

    std::string_view uid;
    r.read_fixed_ascii(uid, layout::USER_ID_WIDTH);

    std::uint8_t verify = 0;
    std::uint32_t packed = 0;
    std::uint8_t status = 0;
    r.read_u8(verify);
    r.read_u32le(packed);
    r.read_u8(status);

    AttendanceRecord rec_out;
    if (!parse_user_id(uid, rec_out.user_id)) {
        return Status{StatusCode::DecodeError, "bad user id '" + std::string(uid) + "'"};
    }
    if (!decode_packed_time(packed, rec_out.timestamp)) {
        return Status{StatusCode::DecodeError, "invalid timestamp " + std::to_string(packed)};
    }
    rec_out.verify_type = verify;
    rec_out.status = status;

    out = rec_out;
    return Status::ok();
}

static bool timestamp_is_zero(const std::uint8_t* rec)
{
    return io::bytecodec::load_u32le(rec + layout::TIMESTAMP_OFFSET) == 0;
}

DecodeSummary decode_records(const std::uint8_t* data, std::size_t len,
                             std::vector<AttendanceRecord>& out,
                             std::size_t table_size)
{
    DecodeSummary sum;

    if (table_size < len) {
        table_size = len;
    }
    if (len >= 4 && io::bytecodec::load_u32le(data) == table_size - 4) {
        data += 4;
        len -= 4;
        sum.size_prefix_stripped = true;
    }

    const std::size_t count = len / layout::SIZE;
    sum.trailing_bytes = len % layout::SIZE;
    out.reserve(out.size() + count);

    for (std::size_t i = 0; i < count; ++i) {
        const std::uint8_t* rec = data + i * layout::SIZE;

        if (i == 0 && timestamp_is_zero(rec)) {
            sum.header_skipped = true;
            continue;
        }

        AttendanceRecord ar;
        const Status st = decode_record(rec, ar);
        if (!st) {
            ++sum.decode_errors;
            AL_LOGD(TAG, "skipping record %u: %s", (unsigned)i, st.describe().c_str());
            continue;
        }
        out.push_back(ar);
        ++sum.decoded;
    }

    if (sum.trailing_bytes) {
        AL_LOGW(TAG, "ignoring %u trailing bytes", (unsigned)sum.trailing_bytes);
    }
    AL_LOGI(TAG, "decoded %u records (%u skipped)",
            (unsigned)sum.decoded, (unsigned)sum.decode_errors);
    return sum;
}

DecodeSummary decode_records(const ByteBuffer& data, std::vector<AttendanceRecord>& out,
                             std::size_t table_size)
{
    return decode_records(data.data(), data.size(), out, table_size);
}

void encode_record(const AttendanceRecord& rec, std::uint16_t slot, ByteBuffer& out)
{
    using namespace io::bytecodec;

    write_u16le(out, slot);
    write_fixed_ascii(out, std::to_string(rec.user_id), layout::USER_ID_WIDTH);
    write_u8(out, rec.verify_type);
    write_u32le(out, encode_packed_time(rec.timestamp));
    write_u8(out, rec.status);
    for (std::size_t i = layout::STATUS_OFFSET + 1; i < layout::SIZE; ++i) {
        write_u8(out, 0);
    }
}

} // namespace attlog::device
