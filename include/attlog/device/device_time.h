#pragma once

#include <cstdint>
#include <string>

namespace attlog::device {

// Civil time as kept by the terminal clock. The terminal stores no zone.
struct DeviceTime {
    std::uint16_t year{2000};
    std::uint8_t  month{1};
    std::uint8_t  day{1};
    std::uint8_t  hour{0};
    std::uint8_t  minute{0};
    std::uint8_t  second{0};
};

bool operator==(const DeviceTime& a, const DeviceTime& b) noexcept;
bool operator!=(const DeviceTime& a, const DeviceTime& b) noexcept;
bool operator<(const DeviceTime& a, const DeviceTime& b) noexcept;

bool is_leap_year(int year) noexcept;
int  days_in_month(int year, int month) noexcept;

// True when the fields name a real calendar instant the packed format can hold.
bool is_valid(const DeviceTime& t) noexcept;

/**
 * Packed timestamp format used on flash:
 *
 *   ((((year-2000)*12 + month-1)*31 + day-1)*24 + hour)*60 + minute)*60 + second
 *
 * Every month is given 31 days, so some packed values name dates that do not
 * exist (e.g. 31 February). decode_packed_time() rejects those.
 */
bool decode_packed_time(std::uint32_t packed, DeviceTime& out) noexcept;

// Caller guarantees is_valid(t).
std::uint32_t encode_packed_time(const DeviceTime& t) noexcept;

// "YYYY-MM-DD HH:MM:SS"
std::string format_time(const DeviceTime& t);

} // namespace attlog::device
