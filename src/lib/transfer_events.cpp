#include "attlog/device/transfer_events.h"

namespace attlog::device {

const char* to_string(TransferPhase p) noexcept
{
    switch (p) {
    case TransferPhase::Connecting:    return "connecting";
    case TransferPhase::Locking:       return "locking";
    case TransferPhase::Preparing:     return "preparing";
    case TransferPhase::Streaming:     return "streaming";
    case TransferPhase::Freeing:       return "freeing";
    case TransferPhase::Unlocking:     return "unlocking";
    case TransferPhase::Decoding:      return "decoding";
    case TransferPhase::Disconnecting: return "disconnecting";
    case TransferPhase::Finished:      return "finished";
    }
    return "?";
}

} // namespace attlog::device
