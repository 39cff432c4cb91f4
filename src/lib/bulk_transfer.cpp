#include "attlog/device/bulk_transfer.h"

#include "attlog/core/logging.h"
#include "attlog/device/device_control.h"
#include "attlog/device/record_decoder.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

namespace attlog::device {

static constexpr const char* TAG = "bulk";

using protocol::command_name;

const char* to_string(TransferState s) noexcept
{
    switch (s) {
    case TransferState::Idle:           return "Idle";
    case TransferState::DeviceLocked:   return "DeviceLocked";
    case TransferState::TableReady:     return "TableReady";
    case TransferState::Streaming:      return "Streaming";
    case TransferState::BufferFreed:    return "BufferFreed";
    case TransferState::DeviceUnlocked: return "DeviceUnlocked";
    }
    return "?";
}

std::uint32_t max_chunk_iterations(std::uint32_t total_size) noexcept
{
    const std::uint32_t per_record = static_cast<std::uint32_t>(protocol::RECORD_SIZE);
    return total_size / per_record + (total_size % per_record ? 1u : 0u) + 1u;
}

Status classify_chunk_response(InnerMessage& msg, ChunkResponse& out)
{
    if (protocol::is(msg.command, Command::PrepareData)) {
        out = ShapeAckThenData{msg.reply_id};
        return Status::ok();
    }
    if (protocol::is(msg.command, Command::Data)) {
        out = ShapeDirectData{std::move(msg.data)};
        return Status::ok();
    }
    return Status{StatusCode::ProtocolError,
                  std::string("unexpected chunk response ") + command_name(msg.command) +
                  " (" + std::to_string(msg.command) + ")"};
}

// ---------------------------------------------------------------------------

class BulkTransfer::CleanupScope {
public:
    explicit CleanupScope(BulkTransfer& owner) : _owner(owner) {}

    ~CleanupScope()
    {
        _owner.free_buffer();
        _owner.unlock_device();
    }

    CleanupScope(const CleanupScope&) = delete;
    CleanupScope& operator=(const CleanupScope&) = delete;

private:
    BulkTransfer& _owner;
};

BulkTransfer::BulkTransfer(Session& session, BulkTransferOptions opts)
    : _session(session)
    , _opts(opts)
{
    if (_opts.max_chunk == 0 || _opts.max_chunk > protocol::MAX_CHUNK) {
        _opts.max_chunk = protocol::MAX_CHUNK;
    }
}

void BulkTransfer::publish(TransferPhase phase)
{
    _progress.publish(TransferProgress{phase, _offset, _total_size});
}

void BulkTransfer::fail(const Status& st)
{
    AL_LOGE(TAG, "transfer aborted in %s at %u/%u bytes: %s",
            to_string(_state), (unsigned)_offset, (unsigned)_total_size,
            st.describe().c_str());
    // First failure wins; cleanup problems never replace it.
    if (_status.is_ok()) {
        _status = st;
    }
}

TransferResult BulkTransfer::run(const CancelToken* cancel)
{
    _cancel = cancel;
    _buffer.clear();
    _total_size = 0;
    _offset = 0;
    _chunks = 0;
    _status = Status::ok();
    _cancelled = false;
    _freed = false;
    _unlocked = false;
    _cleanup_failures = 0;
    _state = TransferState::Idle;

    const auto started = std::chrono::steady_clock::now();

    {
        CleanupScope cleanup(*this);
        do {
            _state = step(_state);
        } while (_state != TransferState::Idle);
    }

    publish(TransferPhase::Decoding);

    TransferResult result;
    const DecodeSummary summary = decode_records(_buffer, result.records, _total_size);

    result.status = _status;
    result.cancelled = _cancelled;
    result.cleanup_failures = _cleanup_failures;
    result.stats.bytes_received = _offset;
    result.stats.total_size = _total_size;
    result.stats.chunks = _chunks;
    result.stats.decode_errors = summary.decode_errors;
    result.stats.trailing_bytes = summary.trailing_bytes;
    result.stats.elapsed_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());

    ByteBuffer().swap(_buffer);
    _cancel = nullptr;

    AL_LOGI(TAG, "%u/%u bytes in %u chunks, %u records, %u decode errors (%s%s)",
            (unsigned)result.stats.bytes_received, (unsigned)result.stats.total_size,
            (unsigned)result.stats.chunks, (unsigned)result.records.size(),
            (unsigned)result.stats.decode_errors, result.status.describe().c_str(),
            result.cancelled ? ", cancelled" : "");
    return result;
}

TransferState BulkTransfer::step(TransferState s)
{
    switch (s) {
    case TransferState::Idle:           return on_idle();
    case TransferState::DeviceLocked:   return on_device_locked();
    case TransferState::TableReady:     return on_table_ready();
    case TransferState::Streaming:      return on_streaming();
    case TransferState::BufferFreed:    return on_buffer_freed();
    case TransferState::DeviceUnlocked: return on_device_unlocked();
    }
    return TransferState::Idle;
}

TransferState BulkTransfer::on_idle()
{
    publish(TransferPhase::Locking);
    // Proceed whether or not the terminal confirms.
    (void)disable_device(_session);
    return TransferState::DeviceLocked;
}

TransferState BulkTransfer::on_device_locked()
{
    publish(TransferPhase::Preparing);

    std::uint32_t total = 0;
    bool inline_data = false;
    const Status st = prepare_table(total, inline_data);
    if (!st) {
        fail(st);
        free_buffer();
        return TransferState::BufferFreed;
    }

    _total_size = total;
    if (inline_data) {
        AL_LOGI(TAG, "attendance table of %u bytes arrived inline", (unsigned)total);
        _offset = total;
        publish(TransferPhase::Streaming);
        free_buffer();
        return TransferState::BufferFreed;
    }
    if (total == 0) {
        AL_LOGI(TAG, "attendance table is empty");
        free_buffer();
        return TransferState::BufferFreed;
    }

    AL_LOGI(TAG, "attendance table holds %u bytes", (unsigned)total);
    return TransferState::TableReady;
}

TransferState BulkTransfer::on_table_ready()
{
    _buffer.reserve(_total_size);
    _offset = 0;
    publish(TransferPhase::Streaming);
    return TransferState::Streaming;
}

TransferState BulkTransfer::on_streaming()
{
    const std::uint32_t limit = max_chunk_iterations(_total_size);

    while (_offset < _total_size) {
        if (_cancel && _cancel->cancelled()) {
            AL_LOGW(TAG, "cancelled after %u/%u bytes", (unsigned)_offset, (unsigned)_total_size);
            _cancelled = true;
            break;
        }
        if (_chunks >= limit) {
            fail(Status{StatusCode::ProtocolError,
                        "no end of stream after " + std::to_string(limit) + " chunk requests"});
            break;
        }

        const std::uint32_t request = std::min(_total_size - _offset, _opts.max_chunk);
        ByteBuffer data;
        const Status st = read_chunk(_offset, request, data);
        ++_chunks;
        if (!st) {
            fail(st);
            break;
        }

        if (data.empty()) {
            AL_LOGW(TAG, "empty chunk at offset %u, treating as end of stream", (unsigned)_offset);
            break;
        }

        const std::uint32_t room = _total_size - _offset;
        if (data.size() > room) {
            AL_LOGW(TAG, "chunk at offset %u overruns table by %u bytes, dropping surplus",
                    (unsigned)_offset, (unsigned)(data.size() - room));
            data.resize(room);
        }

        _buffer.insert(_buffer.end(), data.begin(), data.end());
        _offset += static_cast<std::uint32_t>(data.size());

        AL_LOGD(TAG, "chunk %u: %u bytes (%u/%u)", (unsigned)_chunks,
                (unsigned)data.size(), (unsigned)_offset, (unsigned)_total_size);
        publish(TransferPhase::Streaming);
    }

    free_buffer();
    return TransferState::BufferFreed;
}

TransferState BulkTransfer::on_buffer_freed()
{
    unlock_device();
    return TransferState::DeviceUnlocked;
}

TransferState BulkTransfer::on_device_unlocked()
{
    return TransferState::Idle;
}

Status BulkTransfer::skip_stale_acks(InnerMessage& reply)
{
    // A late AckOk for an earlier tolerated command (e.g. a disable-device
    // reply that missed its deadline) carries an older reply id and no data.
    unsigned skipped = 0;
    while (protocol::is(reply.command, Command::AckOk)
           && reply.reply_id != _session.reply_id()
           && reply.data.empty()) {
        if (skipped >= _opts.max_stale_acks) {
            return Status{StatusCode::ProtocolError, "too many stale acknowledgements"};
        }
        ++skipped;
        AL_LOGD(TAG, "skipping stale ACK_OK for reply %u", (unsigned)reply.reply_id);

        InnerMessage next;
        const Status st = _session.receive(next);
        if (!st) {
            return st;
        }
        reply = std::move(next);
    }
    return Status::ok();
}

Status BulkTransfer::prepare_table(std::uint32_t& total, bool& inline_data)
{
    inline_data = false;

    InnerMessage reply;
    Status st = _session.send(Command::DataWrrq,
                              protocol::ATTLOG_TABLE_SELECTOR,
                              sizeof(protocol::ATTLOG_TABLE_SELECTOR),
                              reply);
    if (st) {
        st = skip_stale_acks(reply);
    }
    if (!st) {
        return st;
    }

    // Small tables may come back whole instead of as a size.
    if (protocol::is(reply.command, Command::Data)) {
        if (reply.data.size() > _opts.max_total_size) {
            return Status{StatusCode::CapacityError,
                          "inline table of " + std::to_string(reply.data.size()) + " bytes exceeds limit"};
        }
        total = static_cast<std::uint32_t>(reply.data.size());
        _buffer = std::move(reply.data);
        inline_data = true;
        return Status::ok();
    }

    if (!protocol::is(reply.command, Command::AckOk)
        && !protocol::is(reply.command, Command::PrepareData)) {
        return Status{StatusCode::ProtocolError,
                      std::string("table prepare answered ") + command_name(reply.command)};
    }

    const std::size_t at = _opts.prepare_size_offset;
    if (reply.data.size() < at + 4) {
        return Status{StatusCode::CapacityError,
                      "table prepare reply carries no size at offset " + std::to_string(at) +
                      " (" + std::to_string(reply.data.size()) + " bytes)"};
    }

    total = io::bytecodec::load_u32le(reply.data.data() + at);
    if (total > _opts.max_total_size) {
        return Status{StatusCode::CapacityError,
                      "table size " + std::to_string(total) + " exceeds limit " +
                      std::to_string(_opts.max_total_size)};
    }
    return Status::ok();
}

namespace {

// Single dispatch point for both chunk reply shapes.
struct ChunkCollector {
    Session&    session;
    ByteBuffer& out;

    Status operator()(ShapeAckThenData&) const
    {
        InnerMessage next;
        const Status st = session.receive(next);
        if (!st) {
            return st;
        }
        if (!protocol::is(next.command, Command::Data)) {
            return Status{StatusCode::ProtocolError,
                          std::string("expected DATA after PREPARE_DATA, got ") +
                          protocol::command_name(next.command)};
        }
        out = std::move(next.data);
        return Status::ok();
    }

    Status operator()(ShapeDirectData& shape) const
    {
        out = std::move(shape.data);
        return Status::ok();
    }
};

} // namespace

Status BulkTransfer::collect(ChunkResponse& shape, ByteBuffer& data)
{
    return std::visit(ChunkCollector{_session, data}, shape);
}

Status BulkTransfer::read_chunk(std::uint32_t offset, std::uint32_t size, ByteBuffer& data)
{
    ByteBuffer req;
    io::bytecodec::write_u32le(req, offset);
    io::bytecodec::write_u32le(req, size);

    InnerMessage reply;
    Status st = _session.send(Command::ReadBuffer, req, reply);
    if (st) {
        st = skip_stale_acks(reply);
    }
    if (!st) {
        return st;
    }

    ChunkResponse shape;
    st = classify_chunk_response(reply, shape);
    if (!st) {
        return st;
    }
    return collect(shape, data);
}

void BulkTransfer::free_buffer()
{
    if (_freed) {
        return;
    }
    _freed = true;
    publish(TransferPhase::Freeing);

    InnerMessage reply;
    const Status st = _session.send_best_effort(Command::FreeData, reply);
    if (!st) {
        ++_cleanup_failures;
        AL_LOGW(TAG, "free buffer failed: %s", st.describe().c_str());
    } else if (!protocol::is(reply.command, Command::AckOk)) {
        AL_LOGW(TAG, "free buffer answered %s", command_name(reply.command));
    }
}

void BulkTransfer::unlock_device()
{
    if (_unlocked) {
        return;
    }
    _unlocked = true;
    publish(TransferPhase::Unlocking);

    if (!enable_device(_session)) {
        ++_cleanup_failures;
    }
}

} // namespace attlog::device
