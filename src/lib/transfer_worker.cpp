#include "attlog/device/transfer_worker.h"

#include "attlog/core/logging.h"

#include <utility>

namespace attlog::device {

static constexpr const char* TAG = "worker";

SessionFactory tcp_session_factory(net::ITcpSocketOps& ops,
                                   std::string host,
                                   std::uint16_t port,
                                   net::StreamTimeouts timeouts)
{
    return [&ops, host = std::move(host), port, timeouts](std::unique_ptr<Session>& out) {
        return Session::connect(ops, host, port, timeouts, out);
    };
}

TransferResult pull_attendance(const SessionFactory& connect,
                               const BulkTransferOptions& opts,
                               const CancelToken* cancel,
                               core::EventStream<TransferProgress>* progress)
{
    auto emit = [progress](TransferPhase phase, const TransferResult* r) {
        if (!progress) return;
        TransferProgress ev{phase, 0, 0};
        if (r) {
            ev.bytes_received = r->stats.bytes_received;
            ev.total_size = r->stats.total_size;
        }
        progress->publish(ev);
    };

    emit(TransferPhase::Connecting, nullptr);

    std::unique_ptr<Session> session;
    const Status st = connect ? connect(session)
                              : Status{StatusCode::InvalidArgument, "no session factory"};
    if (!st || !session) {
        AL_LOGE(TAG, "connect failed: %s", st.describe().c_str());
        TransferResult failed;
        failed.status = st.is_ok() ? Status{StatusCode::TransportError, "no session"} : st;
        emit(TransferPhase::Finished, &failed);
        return failed;
    }

    TransferResult result;
    {
        BulkTransfer transfer(*session, opts);
        if (progress) {
            core::ScopedSubscription<TransferProgress> forward(
                transfer.progress(),
                [progress](const TransferProgress& ev) { progress->publish(ev); });
            result = transfer.run(cancel);
        } else {
            result = transfer.run(cancel);
        }
    }

    emit(TransferPhase::Disconnecting, &result);
    session->disconnect();
    session.reset();

    emit(TransferPhase::Finished, &result);
    return result;
}

// ---------------------------------------------------------------------------

TransferWorker::TransferWorker(SessionFactory connect, BulkTransferOptions opts)
    : _connect(std::move(connect))
    , _opts(opts)
{
}

TransferWorker::~TransferWorker()
{
    if (_thread.joinable()) {
        _cancel.cancel();
        _thread.join();
    }
}

bool TransferWorker::start()
{
    if (_started) {
        return false;
    }
    _started = true;
    _running.store(true);
    _thread = std::thread([this] { run(); });
    return true;
}

void TransferWorker::run()
{
    core::EventStream<TransferProgress> progress;
    core::ScopedSubscription<TransferProgress> forward(
        progress,
        [this](const TransferProgress& ev) { _events.push(ev); });

    _result = pull_attendance(_connect, _opts, &_cancel, &progress);

    _running.store(false);
    _events.close();
}

TransferResult TransferWorker::wait()
{
    if (_thread.joinable()) {
        _thread.join();
    }
    return std::move(_result);
}

} // namespace attlog::device
