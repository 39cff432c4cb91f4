#include "attlog/device/device_control.h"

#include "attlog/core/logging.h"

#include <string>

namespace attlog::device {

static constexpr const char* TAG = "control";

using protocol::command_name;

const char* to_string(ClearOutcome o) noexcept
{
    switch (o) {
    case ClearOutcome::NotConfirmed:   return "not-confirmed";
    case ClearOutcome::BelowThreshold: return "below-threshold";
    case ClearOutcome::Cleared:        return "cleared";
    }
    return "?";
}

static Status expect_ack(const InnerMessage& reply, const char* what)
{
    if (protocol::is(reply.command, Command::AckOk)) {
        return Status::ok();
    }
    return Status{StatusCode::ProtocolError,
                  std::string(what) + " answered " + command_name(reply.command)};
}

static Status bracket(Session& session, Command cmd, const char* what)
{
    InnerMessage reply;
    Status st = session.send_best_effort(cmd, reply);
    if (st) {
        st = expect_ack(reply, what);
    }
    if (!st) {
        AL_LOGW(TAG, "%s not confirmed: %s", what, st.describe().c_str());
    }
    return st;
}

Status disable_device(Session& session)
{
    return bracket(session, Command::DisableDevice, "disable device");
}

Status enable_device(Session& session)
{
    return bracket(session, Command::EnableDevice, "enable device");
}

Status parse_capacity(const ByteBuffer& data, CapacityStats& out)
{
    if (data.size() < capacity_layout::FIELD_COUNT * 4) {
        return Status{StatusCode::ProtocolError,
                      "capacity table too short (" + std::to_string(data.size()) + " bytes)"};
    }

    auto field = [&](std::size_t idx) {
        return io::bytecodec::load_u32le(data.data() + idx * 4);
    };

    out.record_count     = field(capacity_layout::RECORDS);
    out.record_capacity  = field(capacity_layout::RECORDS_CAPACITY);
    out.record_available = field(capacity_layout::RECORDS_AVAILABLE);
    return Status::ok();
}

Status read_capacity(Session& session, CapacityStats& out)
{
    InnerMessage reply;
    Status st = session.send(Command::GetFreeSizes, reply);
    if (!st) {
        return st;
    }
    if (!protocol::is(reply.command, Command::AckOk)) {
        return Status{StatusCode::ProtocolError,
                      std::string("capacity query answered ") + command_name(reply.command)};
    }

    st = parse_capacity(reply.data, out);
    if (st) {
        AL_LOGI(TAG, "terminal holds %u records (capacity %u, free %u)",
                (unsigned)out.record_count, (unsigned)out.record_capacity,
                (unsigned)out.record_available);
    }
    return st;
}

Status clear_attendance_log(Session& session)
{
    InnerMessage reply;
    Status st = session.send(Command::ClearAttLog, reply);
    if (st) {
        st = expect_ack(reply, "clear attendance log");
    }
    if (st) {
        AL_LOGI(TAG, "attendance log cleared");
    } else {
        AL_LOGE(TAG, "clear attendance log failed: %s", st.describe().c_str());
    }
    return st;
}

PersistReceipt PersistReceipt::for_batch(const TransferResult& result, bool durable)
{
    PersistReceipt r;
    r.records_persisted = result.records.size();
    r.records_read = result.records.size() + result.stats.decode_errors;
    r.batch_complete = result.complete();
    r.durable = durable;
    return r;
}

Status clear_if_due(Session& session,
                    const PersistReceipt& receipt,
                    std::uint32_t threshold,
                    ClearOutcome& outcome,
                    CapacityStats* stats)
{
    outcome = ClearOutcome::NotConfirmed;

    if (!receipt.batch_complete || !receipt.durable) {
        AL_LOGW(TAG, "refusing to clear: batch %s, %s",
                receipt.batch_complete ? "complete" : "incomplete",
                receipt.durable ? "durable" : "not durable");
        return Status::ok();
    }

    CapacityStats cap;
    Status st = read_capacity(session, cap);
    if (!st) {
        return st;
    }
    if (stats) {
        *stats = cap;
    }

    if (cap.record_count <= threshold) {
        AL_LOGI(TAG, "%u records, threshold %u: not clearing",
                (unsigned)cap.record_count, (unsigned)threshold);
        outcome = ClearOutcome::BelowThreshold;
        return Status::ok();
    }

    if (cap.record_count > receipt.records_read) {
        AL_LOGW(TAG, "refusing to clear: terminal holds %u records, batch read %u",
                (unsigned)cap.record_count, (unsigned)receipt.records_read);
        return Status::ok();
    }

    st = clear_attendance_log(session);
    if (st) {
        outcome = ClearOutcome::Cleared;
    }
    return st;
}

} // namespace attlog::device
