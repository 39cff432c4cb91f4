#include "attlog/device/device_time.h"

#include <cstdio>
#include <tuple>

namespace attlog::device {

namespace {

constexpr std::uint32_t kSecondsPerPackedYear = 12u * 31u * 24u * 60u * 60u;
constexpr int kBaseYear = 2000;
constexpr int kMaxYear = kBaseYear + static_cast<int>(0xFFFFFFFFu / kSecondsPerPackedYear) - 1;

auto as_tuple(const DeviceTime& t)
{
    return std::make_tuple(t.year, t.month, t.day, t.hour, t.minute, t.second);
}

} // namespace

bool operator==(const DeviceTime& a, const DeviceTime& b) noexcept
{
    return as_tuple(a) == as_tuple(b);
}

bool operator!=(const DeviceTime& a, const DeviceTime& b) noexcept
{
    return !(a == b);
}

bool operator<(const DeviceTime& a, const DeviceTime& b) noexcept
{
    return as_tuple(a) < as_tuple(b);
}

bool is_leap_year(int year) noexcept
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) noexcept
{
    static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return kDays[month - 1];
}

bool is_valid(const DeviceTime& t) noexcept
{
    if (t.year < kBaseYear || t.year > kMaxYear) return false;
    if (t.month < 1 || t.month > 12) return false;
    if (t.day < 1 || t.day > days_in_month(t.year, t.month)) return false;
    return t.hour < 24 && t.minute < 60 && t.second < 60;
}

bool decode_packed_time(std::uint32_t v, DeviceTime& out) noexcept
{
    DeviceTime t;
    t.second = static_cast<std::uint8_t>(v % 60); v /= 60;
    t.minute = static_cast<std::uint8_t>(v % 60); v /= 60;
    t.hour   = static_cast<std::uint8_t>(v % 24); v /= 24;
    t.day    = static_cast<std::uint8_t>(v % 31 + 1); v /= 31;
    t.month  = static_cast<std::uint8_t>(v % 12 + 1); v /= 12;
    t.year   = static_cast<std::uint16_t>(v + kBaseYear);

    if (t.day > days_in_month(t.year, t.month)) {
        return false;
    }
    out = t;
    return true;
}

std::uint32_t encode_packed_time(const DeviceTime& t) noexcept
{
    std::uint32_t v = static_cast<std::uint32_t>(t.year - kBaseYear);
    v = v * 12 + (t.month - 1u);
    v = v * 31 + (t.day - 1u);
    v = v * 24 + t.hour;
    v = v * 60 + t.minute;
    v = v * 60 + t.second;
    return v;
}

std::string format_time(const DeviceTime& t)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04u-%02u-%02u %02u:%02u:%02u",
                  (unsigned)t.year, (unsigned)t.month, (unsigned)t.day,
                  (unsigned)t.hour, (unsigned)t.minute, (unsigned)t.second);
    return buf;
}

} // namespace attlog::device
