#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace attlog {

// Outcome classes shared by every layer.
enum class StatusCode : std::uint8_t {
    Ok = 0,
    TransportError,   // connect/read/write failure or timeout
    ProtocolError,    // malformed frame or unexpected response tag
    DecodeError,      // malformed record; per-record, never aborts a batch
    CapacityError,    // table prepare reported an unusable size
    InvalidArgument,
};

const char* to_string(StatusCode code) noexcept;

struct Status {
    StatusCode  code{StatusCode::Ok};
    std::string detail;

    Status() = default;
    Status(StatusCode c, std::string d = {})
        : code(c)
        , detail(std::move(d))
    {}

    static Status ok() { return Status{}; }

    bool is_ok() const noexcept { return code == StatusCode::Ok; }
    explicit operator bool() const noexcept { return is_ok(); }

    // "ProtocolError: unexpected response tag 2001"
    std::string describe() const;
};

} // namespace attlog
