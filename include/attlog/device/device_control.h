#pragma once

#include <cstddef>
#include <cstdint>

#include "attlog/core/status.h"
#include "attlog/device/session.h"
#include "attlog/device/transfer_result.h"

namespace attlog::device {

struct CapacityStats {
    std::uint32_t record_count{0};
    std::uint32_t record_capacity{0};
    std::uint32_t record_available{0};
};

// GetFreeSizes reply: 20 u32 LE fields.
namespace capacity_layout {
inline constexpr std::size_t FIELD_COUNT       = 20;
inline constexpr std::size_t RECORDS           = 8;
inline constexpr std::size_t RECORDS_CAPACITY  = 16;
inline constexpr std::size_t RECORDS_AVAILABLE = 19;
} // namespace capacity_layout

Status parse_capacity(const ByteBuffer& data, CapacityStats& out);

// Best-effort bracketing around a transfer window. A missing or negative
// reply is logged and reported, and callers carry on regardless.
Status disable_device(Session& session);
Status enable_device(Session& session);

Status read_capacity(Session& session, CapacityStats& out);

// Erase the terminal's attendance storage. Requires AckOk.
Status clear_attendance_log(Session& session);

// Proof from the caller that a downloaded batch has been committed.
struct PersistReceipt {
    std::size_t records_persisted{0};
    std::size_t records_read{0};      // decoded plus skipped as malformed
    bool        batch_complete{false};
    bool        durable{false};

    static PersistReceipt for_batch(const TransferResult& result, bool durable);
};

enum class ClearOutcome : std::uint8_t {
    NotConfirmed,    // receipt missing, partial, not durable, or terminal holds unread records
    BelowThreshold,
    Cleared,
};

const char* to_string(ClearOutcome o) noexcept;

/**
 * Clear the attendance log only when a complete batch has been durably
 * persisted and the terminal holds more than `threshold` records, none of
 * which the batch missed.
 * `stats`, when given, receives the capacity table that was read.
 */
Status clear_if_due(Session& session,
                    const PersistReceipt& receipt,
                    std::uint32_t threshold,
                    ClearOutcome& outcome,
                    CapacityStats* stats = nullptr);

} // namespace attlog::device
