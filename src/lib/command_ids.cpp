#include "attlog/protocol/command_ids.h"

namespace attlog::protocol {

const char* command_name(std::uint16_t wire) noexcept
{
    switch (static_cast<Command>(wire)) {
    case Command::GetFreeSizes:  return "GET_FREE_SIZES";
    case Command::AttLogRrq:     return "ATTLOG_RRQ";
    case Command::ClearAttLog:   return "CLEAR_ATTLOG";
    case Command::Connect:       return "CONNECT";
    case Command::Exit:          return "EXIT";
    case Command::DisableDevice: return "DISABLEDEVICE";
    case Command::EnableDevice:  return "ENABLEDEVICE";
    case Command::PrepareData:   return "PREPARE_DATA";
    case Command::Data:          return "DATA";
    case Command::FreeData:      return "FREE_DATA";
    case Command::DataWrrq:      return "DATA_WRRQ";
    case Command::ReadBuffer:    return "READ_BUFFER";
    case Command::AckOk:         return "ACK_OK";
    case Command::AckError:      return "ACK_ERROR";
    case Command::AckData:       return "ACK_DATA";
    case Command::AckUnauth:     return "ACK_UNAUTH";
    }
    return "UNKNOWN";
}

} // namespace attlog::protocol
