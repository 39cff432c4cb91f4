#include <doctest/doctest.h>

#include "fake_terminal.h"

#include "attlog/device/bulk_transfer.h"
#include "attlog/device/session.h"
#include "attlog/device/transfer_events.h"

#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

namespace attlog::tests {

using device::BulkTransfer;
using device::BulkTransferOptions;
using device::CancelToken;
using device::TransferPhase;
using device::TransferProgress;
using device::TransferResult;

namespace {

TransferResult transfer_from(FakeTerminal& term,
                             const CancelToken* cancel = nullptr,
                             BulkTransferOptions opts = {},
                             std::vector<TransferProgress>* events = nullptr)
{
    auto session = open_session(term);
    REQUIRE(session->handshake().is_ok());

    BulkTransfer transfer(*session, opts);
    if (events) {
        transfer.progress().subscribe([events](const TransferProgress& ev) { events->push_back(ev); });
    }
    TransferResult result = transfer.run(cancel);
    CHECK(transfer.state() == device::TransferState::Idle);

    session->disconnect();
    return result;
}

void check_cleanup(const FakeTerminal& term)
{
    CHECK(term.count(Command::FreeData) == 1);
    CHECK(term.count(Command::EnableDevice) == 1);
    CHECK(term.count(Command::Exit) == 1);
    CHECK(term.closes == 1);
}

} // namespace

TEST_CASE("BulkTransfer: 615124-byte table is read in exactly 10 chunks")
{
    const auto records = sample_records(15378);
    FakeTerminal term;
    term.table = build_table(records);
    REQUIRE(term.table.size() == 615124);

    const TransferResult result = transfer_from(term);

    CHECK(result.status.is_ok());
    CHECK(result.complete());
    REQUIRE(term.chunk_requests.size() == 10);

    std::uint32_t expected_offset = 0;
    for (std::size_t i = 0; i < term.chunk_requests.size(); ++i) {
        CHECK(term.chunk_requests[i].first == expected_offset);
        CHECK(term.chunk_requests[i].second == (i < 9 ? 65472u : 25876u));
        expected_offset += term.chunk_requests[i].second;
    }
    CHECK(expected_offset == 615124);

    CHECK(result.stats.bytes_received == 615124);
    CHECK(result.stats.total_size == 615124);
    CHECK(result.stats.chunks == 10);
    CHECK(result.stats.decode_errors == 0);
    CHECK(result.records == records);
    check_cleanup(term);
}

TEST_CASE("BulkTransfer: sequence of commands on the wire")
{
    FakeTerminal term;
    term.table = build_table(sample_records(3));
    transfer_from(term);

    const std::vector<std::uint16_t> expected = {
        protocol::to_wire(Command::Connect),
        protocol::to_wire(Command::DisableDevice),
        protocol::to_wire(Command::DataWrrq),
        protocol::to_wire(Command::ReadBuffer),
        protocol::to_wire(Command::FreeData),
        protocol::to_wire(Command::EnableDevice),
        protocol::to_wire(Command::Exit),
    };
    CHECK(term.commands() == expected);

    const auto& prepare = term.requests[2];
    REQUIRE(prepare.data.size() == sizeof(protocol::ATTLOG_TABLE_SELECTOR));
    CHECK(prepare.data[0] == 0x01);
    CHECK(prepare.data[1] == 0x0D);
}

TEST_CASE("BulkTransfer: both chunk reply shapes yield identical results")
{
    const auto records = sample_records(4000);

    FakeTerminal direct;
    direct.table = build_table(records);
    direct.shape = ChunkShape::DirectData;

    FakeTerminal acked;
    acked.table = direct.table;
    acked.shape = ChunkShape::AckThenData;

    const TransferResult a = transfer_from(direct);
    const TransferResult b = transfer_from(acked);

    REQUIRE(a.status.is_ok());
    REQUIRE(b.status.is_ok());
    CHECK(a.stats.bytes_received == b.stats.bytes_received);
    CHECK(a.stats.chunks == b.stats.chunks);
    CHECK(a.records == b.records);
    CHECK(b.records == records);
    CHECK(acked.pending_reply_bytes() == 0);
}

TEST_CASE("BulkTransfer: empty table")
{
    FakeTerminal term;

    std::vector<TransferProgress> events;
    const TransferResult result = transfer_from(term, nullptr, {}, &events);

    CHECK(result.status.is_ok());
    CHECK(result.records.empty());
    CHECK(result.stats.total_size == 0);
    CHECK(result.stats.chunks == 0);
    CHECK(term.chunk_requests.empty());
    check_cleanup(term);

    bool streamed = false;
    for (const auto& ev : events) {
        if (ev.phase == TransferPhase::Streaming) streamed = true;
    }
    CHECK_FALSE(streamed);
}

TEST_CASE("BulkTransfer: transport failure mid-stream keeps what arrived")
{
    const auto records = sample_records(5000);
    FakeTerminal term;
    term.table = build_table(records);      // 200004 bytes, 4 chunks
    term.stall_after_chunks = 2;

    const TransferResult result = transfer_from(term);

    CHECK(result.status.code == StatusCode::TransportError);
    CHECK_FALSE(result.complete());
    CHECK(term.chunk_requests.size() == 3);
    CHECK(result.stats.bytes_received == 2u * 65472u);
    CHECK(result.stats.total_size == 200004);

    // Two chunks minus the size prefix: 3273 whole records and a fragment.
    REQUIRE(result.records.size() == 3273);
    CHECK(result.stats.trailing_bytes == 20);
    CHECK(std::vector<device::AttendanceRecord>(records.begin(), records.begin() + 3273) == result.records);

    check_cleanup(term);
}

TEST_CASE("BulkTransfer: cancellation stops before the next chunk")
{
    FakeTerminal term;
    term.table = build_table(sample_records(5000));

    CancelToken cancel;
    term.on_chunk = [&cancel](std::uint32_t index) {
        if (index == 1) cancel.cancel();
    };

    const TransferResult result = transfer_from(term, &cancel);

    CHECK(result.cancelled);
    CHECK(result.status.is_ok());
    CHECK_FALSE(result.complete());
    CHECK(term.chunk_requests.size() == 2);
    CHECK(result.stats.bytes_received == 2u * 65472u);
    CHECK(result.records.size() == 3273);
    check_cleanup(term);
}

TEST_CASE("BulkTransfer: offset advances by bytes received, not bytes requested")
{
    const auto records = sample_records(100);
    FakeTerminal term;
    term.table = build_table(records);       // 4004 bytes
    term.max_chunk_served = 1000;

    const TransferResult result = transfer_from(term);

    REQUIRE(result.status.is_ok());
    REQUIRE(term.chunk_requests.size() == 5);
    CHECK(term.chunk_requests[0] == std::make_pair(0u, 4004u));
    CHECK(term.chunk_requests[1] == std::make_pair(1000u, 3004u));
    CHECK(term.chunk_requests[4] == std::make_pair(4000u, 4u));
    CHECK(result.records == records);
}

TEST_CASE("BulkTransfer: configured chunk size is honoured")
{
    FakeTerminal term;
    term.table = build_table(sample_records(100));

    BulkTransferOptions opts;
    opts.max_chunk = 1024;
    const TransferResult result = transfer_from(term, nullptr, opts);

    REQUIRE(result.status.is_ok());
    CHECK(term.chunk_requests.size() == 4);
    for (const auto& req : term.chunk_requests) {
        CHECK(req.second <= 1024);
    }
}

TEST_CASE("BulkTransfer: empty data payload ends the stream")
{
    FakeTerminal term;
    term.table = build_table(sample_records(10));
    term.empty_chunks = true;

    const TransferResult result = transfer_from(term);

    CHECK(result.status.is_ok());
    CHECK_FALSE(result.complete());
    CHECK(term.chunk_requests.size() == 1);
    CHECK(result.stats.bytes_received == 0);
    CHECK(result.records.empty());
    check_cleanup(term);
}

TEST_CASE("BulkTransfer: terminal hanging up mid-stream is a transport error")
{
    FakeTerminal term;
    term.table = build_table(sample_records(5000));
    term.hang_up_on = Command::ReadBuffer;

    const TransferResult result = transfer_from(term);

    CHECK(result.status.code == StatusCode::TransportError);
    CHECK_FALSE(result.complete());
    CHECK(result.records.empty());
    check_cleanup(term);
}

TEST_CASE("BulkTransfer: table size behind a flag byte")
{
    const auto records = sample_records(2000);
    FakeTerminal term;
    term.table = build_table(records);
    term.prepare_flag_byte = true;

    SUBCASE("read at the default offset it is out of range") {
        const TransferResult result = transfer_from(term);
        CHECK(result.status.code == StatusCode::CapacityError);
        CHECK(term.chunk_requests.empty());
    }

    SUBCASE("read at offset 1") {
        BulkTransferOptions opts;
        opts.prepare_size_offset = 1;
        const TransferResult result = transfer_from(term, nullptr, opts);
        CHECK(result.status.is_ok());
        CHECK(result.complete());
        CHECK(result.stats.total_size == 80004);
        CHECK(result.records == records);
    }
}

TEST_CASE("BulkTransfer: prepare answered with the table inline")
{
    const auto records = sample_records(30);
    FakeTerminal term;
    term.table = build_table(records);
    term.prepare_inline = true;

    const TransferResult result = transfer_from(term);

    CHECK(result.status.is_ok());
    CHECK(result.complete());
    CHECK(term.chunk_requests.empty());
    CHECK(result.stats.chunks == 0);
    CHECK(result.stats.bytes_received == term.table.size());
    CHECK(result.records == records);
    check_cleanup(term);
}

TEST_CASE("BulkTransfer: unexpected chunk reply tag is a protocol error")
{
    FakeTerminal term;
    term.table = build_table(sample_records(10));
    term.chunk_reply_tag = protocol::to_wire(Command::AckError);

    const TransferResult result = transfer_from(term);

    CHECK(result.status.code == StatusCode::ProtocolError);
    CHECK(term.chunk_requests.size() == 1);
    check_cleanup(term);
}

TEST_CASE("BulkTransfer: shape A must be followed by a data packet")
{
    FakeTerminal term;
    term.table = build_table(sample_records(10));
    term.shape = ChunkShape::AckThenData;
    term.shape_a_followup_tag = protocol::to_wire(Command::AckOk);

    const TransferResult result = transfer_from(term);

    CHECK(result.status.code == StatusCode::ProtocolError);
    CHECK(result.records.empty());
    check_cleanup(term);
}

TEST_CASE("BulkTransfer: lock reply problems do not stop the transfer")
{
    const auto records = sample_records(50);

    SUBCASE("no reply to disable-device") {
        FakeTerminal term;
        term.table = build_table(records);
        term.drop_disable_reply = true;

        const TransferResult result = transfer_from(term);
        CHECK(result.status.is_ok());
        CHECK(result.records == records);
    }

    SUBCASE("disable-device reply arrives late") {
        FakeTerminal term;
        term.table = build_table(records);
        term.late_disable_reply = true;

        const TransferResult result = transfer_from(term);
        CHECK(result.status.is_ok());
        CHECK(result.records == records);
        CHECK(term.pending_reply_bytes() == 0);
    }
}

TEST_CASE("BulkTransfer: unusable table size is a capacity error")
{
    SUBCASE("prepare reply without a size") {
        FakeTerminal term;
        term.prepare_without_size = true;

        const TransferResult result = transfer_from(term);
        CHECK(result.status.code == StatusCode::CapacityError);
        CHECK(term.chunk_requests.empty());
        check_cleanup(term);
    }

    SUBCASE("size beyond the limit") {
        FakeTerminal term;
        term.announced_size = device::MAX_TABLE_SIZE + 1;

        const TransferResult result = transfer_from(term);
        CHECK(result.status.code == StatusCode::CapacityError);
        CHECK(term.chunk_requests.empty());
        check_cleanup(term);
    }
}

TEST_CASE("BulkTransfer: chunk request count is bounded")
{
    CHECK(device::max_chunk_iterations(0) == 1);
    CHECK(device::max_chunk_iterations(40) == 2);
    CHECK(device::max_chunk_iterations(41) == 3);
    CHECK(device::max_chunk_iterations(615124) == 15380);

    FakeTerminal term;
    term.table = ByteBuffer(100, 0x30);
    term.max_chunk_served = 1;

    const TransferResult result = transfer_from(term);

    CHECK(result.status.code == StatusCode::ProtocolError);
    CHECK(term.chunk_requests.size() == device::max_chunk_iterations(100));
    CHECK(result.stats.bytes_received == device::max_chunk_iterations(100));
    check_cleanup(term);
}

TEST_CASE("BulkTransfer: progress events")
{
    FakeTerminal term;
    term.table = build_table(sample_records(5000));

    std::vector<TransferProgress> events;
    transfer_from(term, nullptr, {}, &events);

    REQUIRE_FALSE(events.empty());
    CHECK(events.front().phase == TransferPhase::Locking);
    CHECK(events.back().phase == TransferPhase::Decoding);

    std::vector<TransferPhase> phases;
    std::uint32_t last_bytes = 0;
    for (const auto& ev : events) {
        if (phases.empty() || phases.back() != ev.phase) phases.push_back(ev.phase);
        CHECK(ev.bytes_received >= last_bytes);
        last_bytes = ev.bytes_received;
    }

    const std::vector<TransferPhase> expected = {
        TransferPhase::Locking,
        TransferPhase::Preparing,
        TransferPhase::Streaming,
        TransferPhase::Freeing,
        TransferPhase::Unlocking,
        TransferPhase::Decoding,
    };
    CHECK(phases == expected);
    CHECK(last_bytes == 200004);
}

TEST_CASE("BulkTransfer: chunk reply classification")
{
    device::ChunkResponse shape;

    InnerMessage ack;
    ack.command = protocol::to_wire(Command::PrepareData);
    ack.reply_id = 42;
    REQUIRE(device::classify_chunk_response(ack, shape).is_ok());
    REQUIRE(std::holds_alternative<device::ShapeAckThenData>(shape));
    CHECK(std::get<device::ShapeAckThenData>(shape).reply_id == 42);

    InnerMessage data;
    data.command = protocol::to_wire(Command::Data);
    data.data = ByteBuffer(12, 0x01);
    REQUIRE(device::classify_chunk_response(data, shape).is_ok());
    REQUIRE(std::holds_alternative<device::ShapeDirectData>(shape));
    CHECK(std::get<device::ShapeDirectData>(shape).data.size() == 12);

    InnerMessage other;
    other.command = protocol::to_wire(Command::AckOk);
    CHECK(device::classify_chunk_response(other, shape).code == StatusCode::ProtocolError);
}

} // namespace attlog::tests
