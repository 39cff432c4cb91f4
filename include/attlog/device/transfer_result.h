#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "attlog/core/status.h"
#include "attlog/device/record_decoder.h"

namespace attlog::device {

struct TransferStats {
    std::uint32_t bytes_received{0};
    std::uint32_t total_size{0};
    std::uint32_t chunks{0};
    std::uint64_t elapsed_ms{0};
    std::size_t   decode_errors{0};
    std::size_t   trailing_bytes{0};
};

/**
 * Outcome of one bulk read.
 *
 * `records` holds everything decodable from the bytes received, even when
 * `status` reports the error that stopped the transfer early. Cleanup
 * failures are counted but never replace `status`.
 */
struct TransferResult {
    std::vector<AttendanceRecord> records;
    TransferStats stats;
    Status        status;
    bool          cancelled{false};
    unsigned      cleanup_failures{0};

    // Every byte the terminal announced was received and nothing stopped early.
    bool complete() const noexcept
    {
        return status.is_ok() && !cancelled && stats.bytes_received == stats.total_size;
    }
};

} // namespace attlog::device
