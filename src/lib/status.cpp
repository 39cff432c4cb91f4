#include "attlog/core/status.h"

namespace attlog {

const char* to_string(StatusCode code) noexcept
{
    switch (code) {
    case StatusCode::Ok:              return "Ok";
    case StatusCode::TransportError:  return "TransportError";
    case StatusCode::ProtocolError:   return "ProtocolError";
    case StatusCode::DecodeError:     return "DecodeError";
    case StatusCode::CapacityError:   return "CapacityError";
    case StatusCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

std::string Status::describe() const
{
    std::string s = to_string(code);
    if (!detail.empty()) {
        s += ": ";
        s += detail;
    }
    return s;
}

} // namespace attlog
