#include <doctest/doctest.h>

#include "fake_terminal.h"

#include "attlog/device/transfer_worker.h"

#include <chrono>
#include <vector>

namespace attlog::tests {

using device::SessionFactory;
using device::TransferPhase;
using device::TransferProgress;
using device::TransferResult;
using device::TransferWorker;

namespace {

SessionFactory fake_factory(FakeTerminal& term)
{
    return [&term](std::unique_ptr<device::Session>& out) {
        auto session = open_session(term);
        const Status st = session->handshake();
        if (st) {
            out = std::move(session);
        }
        return st;
    };
}

std::vector<TransferProgress> drain(TransferWorker& worker)
{
    std::vector<TransferProgress> out;
    while (auto ev = worker.events().pop()) {
        out.push_back(*ev);
    }
    return out;
}

} // namespace

TEST_CASE("pull_attendance: connect, transfer, disconnect")
{
    const auto records = sample_records(2000);
    FakeTerminal term;
    term.table = build_table(records);

    core::EventStream<TransferProgress> progress;
    std::vector<TransferPhase> phases;
    progress.subscribe([&](const TransferProgress& ev) {
        if (phases.empty() || phases.back() != ev.phase) phases.push_back(ev.phase);
    });

    const TransferResult result = device::pull_attendance(fake_factory(term), {}, nullptr, &progress);

    CHECK(result.status.is_ok());
    CHECK(result.records == records);
    CHECK(term.count(Command::Exit) == 1);
    CHECK(term.closes == 1);

    REQUIRE(phases.size() >= 3);
    CHECK(phases.front() == TransferPhase::Connecting);
    CHECK(phases[phases.size() - 2] == TransferPhase::Disconnecting);
    CHECK(phases.back() == TransferPhase::Finished);
    CHECK(progress.subscriber_count() == 1);
}

TEST_CASE("pull_attendance: connect failure yields an empty result")
{
    FakeTerminal term;
    term.unauth_connect = true;

    std::vector<TransferPhase> phases;
    core::EventStream<TransferProgress> progress;
    progress.subscribe([&](const TransferProgress& ev) { phases.push_back(ev.phase); });

    const TransferResult result = device::pull_attendance(fake_factory(term), {}, nullptr, &progress);

    CHECK(result.status.code == StatusCode::ProtocolError);
    CHECK(result.records.empty());
    CHECK_FALSE(result.complete());
    CHECK(term.count(Command::DisableDevice) == 0);
    CHECK(phases == std::vector<TransferPhase>{TransferPhase::Connecting, TransferPhase::Finished});

    const TransferResult none = device::pull_attendance(SessionFactory{}, {}, nullptr, nullptr);
    CHECK(none.status.code == StatusCode::InvalidArgument);
}

TEST_CASE("TransferWorker: runs in the background and reports through its channel")
{
    const auto records = sample_records(5000);
    FakeTerminal term;
    term.table = build_table(records);

    TransferWorker worker(fake_factory(term));
    REQUIRE(worker.start());
    CHECK_FALSE(worker.start());

    const auto events = drain(worker);
    const TransferResult result = worker.wait();

    CHECK_FALSE(worker.running());
    CHECK(worker.events().closed());
    CHECK(result.status.is_ok());
    CHECK(result.records == records);

    REQUIRE_FALSE(events.empty());
    CHECK(events.front().phase == TransferPhase::Connecting);
    CHECK(events.back().phase == TransferPhase::Finished);
    CHECK(events.back().bytes_received == 200004);
    CHECK(events.back().total_size == 200004);

    std::size_t streaming = 0;
    for (const auto& ev : events) {
        if (ev.phase == TransferPhase::Streaming) ++streaming;
    }
    // One on entering the stream, one per chunk.
    CHECK(streaming == 1 + term.chunk_requests.size());
}

TEST_CASE("TransferWorker: cancel stops the transfer and still cleans up")
{
    FakeTerminal term;
    term.table = build_table(sample_records(10000));

    TransferWorker worker(fake_factory(term));
    term.on_chunk = [&worker](std::uint32_t index) {
        if (index == 0) worker.cancel();
    };

    REQUIRE(worker.start());
    drain(worker);
    const TransferResult result = worker.wait();

    CHECK(result.cancelled);
    CHECK_FALSE(result.complete());
    CHECK(term.chunk_requests.size() == 1);
    CHECK(result.records.size() == (65472 - 4) / 40);
    CHECK(term.count(Command::FreeData) == 1);
    CHECK(term.count(Command::EnableDevice) == 1);
    CHECK(term.count(Command::Exit) == 1);
}

TEST_CASE("TransferWorker: destroying an unstarted or finished worker is safe")
{
    FakeTerminal term;
    {
        TransferWorker idle(fake_factory(term));
    }
    CHECK(term.requests.empty());

    {
        TransferWorker worker(fake_factory(term));
        REQUIRE(worker.start());
        (void)worker.events().pop_for(std::chrono::seconds(5));
    }
    CHECK(term.closes == 1);
}

} // namespace attlog::tests
