#pragma once

#include <atomic>
#include <cstdint>

namespace attlog::device {

enum class TransferPhase : std::uint8_t {
    Connecting,
    Locking,
    Preparing,
    Streaming,
    Freeing,
    Unlocking,
    Decoding,
    Disconnecting,
    Finished,
};

const char* to_string(TransferPhase p) noexcept;

// Published on every phase change and after every received chunk.
struct TransferProgress {
    TransferPhase phase{TransferPhase::Connecting};
    std::uint32_t bytes_received{0};
    std::uint32_t total_size{0};
};

// Cooperative cancellation flag, polled between chunk requests.
class CancelToken {
public:
    void cancel() noexcept { _flag.store(true, std::memory_order_release); }
    bool cancelled() const noexcept { return _flag.load(std::memory_order_acquire); }
    void reset() noexcept { _flag.store(false, std::memory_order_release); }

private:
    std::atomic<bool> _flag{false};
};

} // namespace attlog::device
