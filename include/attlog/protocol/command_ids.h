#pragma once

#include <cstddef>
#include <cstdint>

namespace attlog::protocol {

// Terminal command and reply tags (inner message `command` field).
enum class Command : std::uint16_t {
    GetFreeSizes   = 50,
    AttLogRrq      = 13,    // attendance table id, used inside DataWrrq
    ClearAttLog    = 15,

    Connect        = 1000,
    Exit           = 1001,
    DisableDevice  = 1003,
    EnableDevice   = 1004,

    PrepareData    = 1500,  // data-ready ack, payload follows in a Data packet
    Data           = 1501,
    FreeData       = 1502,
    DataWrrq       = 1503,  // prepare a table for buffered reading
    ReadBuffer     = 1504,  // read one chunk of the prepared buffer

    AckOk          = 2000,
    AckError       = 2001,
    AckData        = 2002,
    AckUnauth      = 2005,
};

constexpr std::uint16_t to_wire(Command c) noexcept
{
    return static_cast<std::uint16_t>(c);
}

constexpr bool is(std::uint16_t wire, Command c) noexcept
{
    return wire == to_wire(c);
}

const char* command_name(std::uint16_t wire) noexcept;

// Largest chunk the terminal will serve per ReadBuffer request.
inline constexpr std::uint32_t MAX_CHUNK = 65472;

// Fixed on-flash attendance record stride.
inline constexpr std::size_t RECORD_SIZE = 40;

// DataWrrq selector for the attendance log: flag, table id (u16 LE), then
// two zeroed u32 fields.
inline constexpr std::uint8_t ATTLOG_TABLE_SELECTOR[11] = {
    0x01, 0x0D, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
};

} // namespace attlog::protocol
