#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>

#include "attlog/core/event_stream.h"
#include "attlog/core/status.h"
#include "attlog/device/session.h"
#include "attlog/device/transfer_events.h"
#include "attlog/device/transfer_result.h"

namespace attlog::device {

enum class TransferState : std::uint8_t {
    Idle,
    DeviceLocked,
    TableReady,
    Streaming,
    BufferFreed,
    DeviceUnlocked,
};

const char* to_string(TransferState s) noexcept;

// Chunk reply shape A: a data-ready ack; the data arrives in the next packet.
struct ShapeAckThenData {
    std::uint16_t reply_id{0};
};

// Chunk reply shape B: the reply carries the data itself.
struct ShapeDirectData {
    ByteBuffer data;
};

using ChunkResponse = std::variant<ShapeAckThenData, ShapeDirectData>;

// PrepareData -> shape A, Data -> shape B, anything else is a ProtocolError.
// Shape B takes ownership of msg.data.
Status classify_chunk_response(InnerMessage& msg, ChunkResponse& out);

// Default byte offset of the u32 LE table size inside the DataWrrq reply.
// Some firmware puts a flag byte first and the size at offset 1.
inline constexpr std::size_t PREPARE_SIZE_OFFSET = 0;

// Largest table size accepted from a DataWrrq reply.
inline constexpr std::uint32_t MAX_TABLE_SIZE = 10000000;

// Upper bound on chunk requests for a table: one request per record, plus one.
std::uint32_t max_chunk_iterations(std::uint32_t total_size) noexcept;

struct BulkTransferOptions {
    std::uint32_t max_chunk{protocol::MAX_CHUNK};  // clamped to 1..MAX_CHUNK
    std::uint32_t max_total_size{MAX_TABLE_SIZE};
    unsigned      max_stale_acks{4};               // per request
    std::size_t   prepare_size_offset{PREPARE_SIZE_OFFSET};
};

/**
 * Reads the attendance table from a terminal over an established session.
 *
 *   Idle -> DeviceLocked -> TableReady -> Streaming -> BufferFreed
 *        -> DeviceUnlocked -> Idle
 *
 * Each state has one handler that performs the work leading to the next
 * state. A failed or empty prepare goes straight to BufferFreed, as does a
 * prepare answered with the whole table inline in a Data reply. The buffer
 * release and device unlock always run, on the normal path and from a scope
 * guard on every other exit. Bytes received before a failure are still
 * decoded and returned with the error.
 *
 * The session stays owned by the caller; disconnecting is the caller's job.
 */
class BulkTransfer {
public:
    explicit BulkTransfer(Session& session, BulkTransferOptions opts = {});

    BulkTransfer(const BulkTransfer&) = delete;
    BulkTransfer& operator=(const BulkTransfer&) = delete;

    // `cancel` is polled before each chunk request.
    TransferResult run(const CancelToken* cancel = nullptr);

    core::EventStream<TransferProgress>& progress() { return _progress; }

    TransferState state() const { return _state; }

private:
    class CleanupScope;

    TransferState step(TransferState s);
    TransferState on_idle();
    TransferState on_device_locked();
    TransferState on_table_ready();
    TransferState on_streaming();
    TransferState on_buffer_freed();
    TransferState on_device_unlocked();

    Status prepare_table(std::uint32_t& total, bool& inline_data);
    Status read_chunk(std::uint32_t offset, std::uint32_t size, ByteBuffer& data);
    Status collect(ChunkResponse& shape, ByteBuffer& data);
    Status skip_stale_acks(InnerMessage& reply);

    void free_buffer();
    void unlock_device();

    void publish(TransferPhase phase);
    void fail(const Status& st);

    Session& _session;
    BulkTransferOptions _opts;
    core::EventStream<TransferProgress> _progress;
    TransferState _state{TransferState::Idle};

    // Per-run state
    const CancelToken* _cancel{nullptr};
    ByteBuffer    _buffer;
    std::uint32_t _total_size{0};
    std::uint32_t _offset{0};
    std::uint32_t _chunks{0};
    Status        _status;
    bool          _cancelled{false};
    bool          _freed{false};
    bool          _unlocked{false};
    unsigned      _cleanup_failures{0};
};

} // namespace attlog::device
