#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include "attlog/config/attlog_config.h"
#include "attlog/config/attlog_config_yaml_store.h"
#include "attlog/core/logging.h"
#include "attlog/device/bulk_transfer.h"
#include "attlog/device/device_control.h"
#include "attlog/device/session.h"
#include "attlog/device/transfer_worker.h"
#include "attlog/platform/tcp_socket_ops.h"
#include "attlog/protocol/command_ids.h"
#include "attlog/version.h"

using namespace attlog;

static const char* TAG = "attlog";

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int)
{
    g_interrupted.store(true);
}

struct CliOptions {
    std::string configPath{"attlog.yaml"};
    std::string host;
    int         port{-1};
    std::string outPath;
    bool        clear{false};
    bool        diagnose{false};
    bool        verbose{false};
};

void usage(const char* argv0)
{
    std::fprintf(stderr,
                 "usage: %s [--config FILE] [--host H] [--port P] [--out FILE] [--clear] [--diagnose] [--verbose]\n"
                 "\n"
                 "  --config FILE  YAML configuration (default attlog.yaml; created if missing)\n"
                 "  --host H       terminal address, overrides device.host\n"
                 "  --port P       terminal TCP port, overrides device.port\n"
                 "  --out FILE     write records here instead of stdout\n"
                 "  --clear        after a complete batch is written to --out, clear the\n"
                 "                 terminal log if it holds more than clear.threshold records\n"
                 "  --diagnose     only check that the terminal answers a connect, then exit\n"
                 "  --verbose      log every packet exchanged\n",
                 argv0);
}

bool parse_args(int argc, char** argv, CliOptions& opt)
{
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        std::string v;
        if (arg == "--config") {
            if (!value(opt.configPath)) return false;
        } else if (arg == "--host") {
            if (!value(opt.host)) return false;
        } else if (arg == "--port") {
            if (!value(v)) return false;
            char* end = nullptr;
            const long p = std::strtol(v.c_str(), &end, 10);
            if (!end || *end != '\0' || p <= 0 || p > 65535) return false;
            opt.port = static_cast<int>(p);
        } else if (arg == "--out") {
            if (!value(opt.outPath)) return false;
        } else if (arg == "--clear") {
            opt.clear = true;
        } else if (arg == "--diagnose") {
            opt.diagnose = true;
        } else if (arg == "--verbose") {
            opt.verbose = true;
        } else {
            return false;
        }
    }
    return true;
}

// One line per record: user id, timestamp, verify type, status.
void write_records(std::FILE* out, const std::vector<device::AttendanceRecord>& records)
{
    for (const auto& r : records) {
        std::fprintf(out, "%u\t%s\t%u\t%u\n",
                     (unsigned)r.user_id,
                     device::format_time(r.timestamp).c_str(),
                     (unsigned)r.verify_type,
                     (unsigned)r.status);
    }
}

// Write and fsync; true only if the data reached stable storage.
bool persist_records(const std::string& path, const std::vector<device::AttendanceRecord>& records)
{
    std::FILE* f = std::fopen(path.c_str(), "w");
    if (!f) {
        std::fprintf(stderr, "cannot open %s: %s\n", path.c_str(), std::strerror(errno));
        return false;
    }

    write_records(f, records);

    bool ok = std::fflush(f) == 0 && ::fsync(fileno(f)) == 0;
    if (std::fclose(f) != 0) {
        ok = false;
    }
    if (!ok) {
        std::fprintf(stderr, "failed writing %s: %s\n", path.c_str(), std::strerror(errno));
    }
    return ok;
}

void print_progress(const device::TransferProgress& ev)
{
    if (ev.total_size > 0) {
        std::fprintf(stderr, "[%s] %u/%u bytes\n", device::to_string(ev.phase),
                     (unsigned)ev.bytes_received, (unsigned)ev.total_size);
    } else {
        std::fprintf(stderr, "[%s]\n", device::to_string(ev.phase));
    }
}

int run_diagnose(const config::DeviceConfig& dev, const net::StreamTimeouts& timeouts)
{
    const device::ConnectionDiagnosis d = device::Session::diagnose(
        platform::default_tcp_socket_ops(), dev.host, dev.port, timeouts);

    std::printf("terminal      %s:%u\n", dev.host.c_str(), (unsigned)dev.port);
    std::printf("tcp           %s (%llu ms)%s%s\n",
                d.tcp_reachable ? "reachable" : "unreachable",
                (unsigned long long)d.tcp_connect_ms,
                d.tcp_error.empty() ? "" : ": ", d.tcp_error.c_str());
    if (!d.tcp_reachable) {
        return 2;
    }

    std::printf("handshake     %s (%llu ms)%s%s\n",
                d.protocol_ok ? "ok" : "failed",
                (unsigned long long)d.handshake_ms,
                d.protocol_error.empty() ? "" : ": ", d.protocol_error.c_str());
    if (d.reply_command != 0) {
        std::printf("reply         %s (%u)\n",
                    protocol::command_name(d.reply_command), (unsigned)d.reply_command);
    }
    if (d.protocol_ok) {
        std::printf("session id    %u\n", (unsigned)d.session_id);
    }
    return d.protocol_ok ? 0 : 2;
}

int run_clear(const device::SessionFactory& connect,
              const device::TransferResult& result,
              bool durable,
              std::uint32_t threshold)
{
    std::unique_ptr<device::Session> session;
    Status st = connect(session);
    if (!st) {
        std::fprintf(stderr, "clear: %s\n", st.describe().c_str());
        return 2;
    }

    device::ClearOutcome outcome = device::ClearOutcome::NotConfirmed;
    device::CapacityStats cap;
    st = device::clear_if_due(*session,
                              device::PersistReceipt::for_batch(result, durable),
                              threshold, outcome, &cap);
    session->disconnect();

    if (!st) {
        std::fprintf(stderr, "clear: %s\n", st.describe().c_str());
        return 2;
    }
    std::fprintf(stderr, "clear: %s (%u records on terminal, threshold %u)\n",
                 device::to_string(outcome), (unsigned)cap.record_count, (unsigned)threshold);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    CliOptions cli;
    if (!parse_args(argc, argv, cli)) {
        usage(argv[0]);
        return 1;
    }

    if (cli.verbose) {
        log::set_max_level(log::Level::Verbose);
    }

    AL_LOGI(TAG, "attlog-pull %.*s", static_cast<int>(version().size()), version().data());

    config::YamlAttlogConfigStore store(cli.configPath);
    config::AttlogConfig cfg = store.load();
    if (!cli.host.empty()) cfg.device.host = cli.host;
    if (cli.port > 0)      cfg.device.port = static_cast<std::uint16_t>(cli.port);

    std::vector<std::string> errors;
    if (!config::validate(cfg, errors)) {
        for (const auto& e : errors) {
            std::fprintf(stderr, "config: %s\n", e.c_str());
        }
        return 1;
    }

    if (cli.clear && cli.outPath.empty()) {
        std::fprintf(stderr, "--clear requires --out\n");
        return 1;
    }

    net::StreamTimeouts timeouts;
    timeouts.connect_ms = cfg.device.connectTimeoutMs;
    timeouts.read_ms    = cfg.device.readTimeoutMs;
    timeouts.write_ms   = cfg.device.writeTimeoutMs;

    if (cli.diagnose) {
        return run_diagnose(cfg.device, timeouts);
    }

    device::BulkTransferOptions topts;
    topts.max_chunk = cfg.transfer.maxChunk;
    topts.prepare_size_offset = cfg.transfer.prepareSizeOffset;

    const device::SessionFactory connect = device::tcp_session_factory(
        platform::default_tcp_socket_ops(), cfg.device.host, cfg.device.port, timeouts);

    std::signal(SIGINT, on_sigint);

    device::TransferWorker worker(connect, topts);
    worker.start();

    bool cancelRequested = false;
    for (;;) {
        auto ev = worker.events().pop_for(std::chrono::milliseconds(200));
        if (ev) {
            print_progress(*ev);
        } else if (worker.events().closed()) {
            break;
        }
        if (g_interrupted.load() && !cancelRequested) {
            std::fprintf(stderr, "interrupt: cancelling after the current chunk\n");
            worker.cancel();
            cancelRequested = true;
        }
    }

    const device::TransferResult result = worker.wait();

    bool durable = false;
    if (cli.outPath.empty()) {
        write_records(stdout, result.records);
        std::fflush(stdout);
    } else {
        durable = persist_records(cli.outPath, result.records);
    }

    std::fprintf(stderr, "%u records, %u/%u bytes, %u chunks, %u skipped, %llu ms: %s%s\n",
                 (unsigned)result.records.size(),
                 (unsigned)result.stats.bytes_received, (unsigned)result.stats.total_size,
                 (unsigned)result.stats.chunks, (unsigned)result.stats.decode_errors,
                 (unsigned long long)result.stats.elapsed_ms,
                 result.status.describe().c_str(),
                 result.cancelled ? " (cancelled)" : "");

    if (!result.complete()) {
        return 2;
    }

    if (cli.clear || cfg.clear.enabled) {
        if (cli.outPath.empty()) {
            AL_LOGW(TAG, "clear.enabled ignored: records were not written to a file");
            return 0;
        }
        return run_clear(connect, result, durable, cfg.clear.threshold);
    }

    return 0;
}
