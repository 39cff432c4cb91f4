#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "attlog/core/event_stream.h"
#include "attlog/core/message_channel.h"
#include "attlog/core/status.h"
#include "attlog/device/bulk_transfer.h"
#include "attlog/device/session.h"
#include "attlog/device/transfer_events.h"
#include "attlog/device/transfer_result.h"
#include "attlog/net/tcp_byte_stream.h"
#include "attlog/net/tcp_socket_ops.h"

namespace attlog::device {

// Produces a connected session, or the reason it could not.
using SessionFactory = std::function<Status(std::unique_ptr<Session>&)>;

SessionFactory tcp_session_factory(net::ITcpSocketOps& ops,
                                   std::string host,
                                   std::uint16_t port,
                                   net::StreamTimeouts timeouts);

/**
 * Connect, run one bulk transfer, disconnect.
 *
 * A failed connect yields an empty result carrying the connect error. The
 * session is disconnected on every path, cancellation included. `progress`
 * is optional.
 */
TransferResult pull_attendance(const SessionFactory& connect,
                               const BulkTransferOptions& opts,
                               const CancelToken* cancel,
                               core::EventStream<TransferProgress>* progress);

// Runs pull_attendance on a background thread. Progress arrives through
// events(); the channel is closed after the Finished event. Single use.
class TransferWorker {
public:
    TransferWorker(SessionFactory connect, BulkTransferOptions opts = {});
    ~TransferWorker();

    TransferWorker(const TransferWorker&) = delete;
    TransferWorker& operator=(const TransferWorker&) = delete;

    // False if the worker was already started.
    bool start();

    // Request cooperative cancellation; the transfer stops before its next
    // chunk request and still runs cleanup.
    void cancel() { _cancel.cancel(); }

    core::MessageChannel<TransferProgress>& events() { return _events; }

    // Join the worker and hand over its result. Call once.
    TransferResult wait();

    bool running() const { return _running.load(); }

private:
    void run();

    SessionFactory _connect;
    BulkTransferOptions _opts;
    CancelToken _cancel;
    core::MessageChannel<TransferProgress> _events;
    TransferResult _result;
    std::thread _thread;
    std::atomic<bool> _running{false};
    bool _started{false};
};

} // namespace attlog::device
