#include <doctest/doctest.h>

#include "attlog/config/attlog_config.h"
#include "attlog/config/attlog_config_yaml_store.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

using attlog::config::AttlogConfig;
using attlog::config::YamlAttlogConfigStore;

namespace {

// Unique scratch path under /tmp, removed on destruction.
struct TempPath {
    std::string path;

    explicit TempPath(const char* stem)
        : path(std::string("/tmp/") + stem + "-" + std::to_string(::getpid()) + ".yaml")
    {
        std::remove(path.c_str());
    }

    ~TempPath() { std::remove(path.c_str()); }
};

void write_file(const std::string& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool configs_equal(const AttlogConfig& a, const AttlogConfig& b)
{
    if (a.device.host != b.device.host) return false;
    if (a.device.port != b.device.port) return false;
    if (a.device.connectTimeoutMs != b.device.connectTimeoutMs) return false;
    if (a.device.readTimeoutMs != b.device.readTimeoutMs) return false;
    if (a.device.writeTimeoutMs != b.device.writeTimeoutMs) return false;

    if (a.transfer.maxChunk != b.transfer.maxChunk) return false;
    if (a.transfer.prepareSizeOffset != b.transfer.prepareSizeOffset) return false;

    if (a.clear.enabled != b.clear.enabled) return false;
    if (a.clear.threshold != b.clear.threshold) return false;

    return true;
}

} // namespace

TEST_CASE("parse_yaml: full document")
{
    const std::string yaml = R"(
device:
  host: "192.168.1.201"
  port: 4371
  connect_timeout_ms: 2000
  read_timeout_ms: 15000
  write_timeout_ms: 4000
transfer:
  max_chunk: 32768
  prepare_size_offset: 1
clear:
  enabled: true
  threshold: 60000
)";

    const AttlogConfig cfg = attlog::config::parse_yaml(yaml);

    CHECK(cfg.device.host == "192.168.1.201");
    CHECK(cfg.device.port == 4371);
    CHECK(cfg.device.connectTimeoutMs == 2000);
    CHECK(cfg.device.readTimeoutMs == 15000);
    CHECK(cfg.device.writeTimeoutMs == 4000);
    CHECK(cfg.transfer.maxChunk == 32768);
    CHECK(cfg.transfer.prepareSizeOffset == 1);
    CHECK(cfg.clear.enabled);
    CHECK(cfg.clear.threshold == 60000);
}

TEST_CASE("parse_yaml: missing sections keep defaults")
{
    const AttlogConfig cfg = attlog::config::parse_yaml("device:\n  host: terminal.local\n");

    CHECK(cfg.device.host == "terminal.local");
    CHECK(cfg.device.port == 4370);
    CHECK(cfg.device.connectTimeoutMs == 5000);
    CHECK(cfg.device.readTimeoutMs == 30000);
    CHECK(cfg.transfer.maxChunk == 65472);
    CHECK(cfg.transfer.prepareSizeOffset == 0);
    CHECK_FALSE(cfg.clear.enabled);
    CHECK(cfg.clear.threshold == 50000);

    CHECK(configs_equal(attlog::config::parse_yaml(""), AttlogConfig{}));
}

TEST_CASE("parse_yaml: out-of-range chunk size is clamped")
{
    CHECK(attlog::config::parse_yaml("transfer:\n  max_chunk: 0\n").transfer.maxChunk == 65472);
    CHECK(attlog::config::parse_yaml("transfer:\n  max_chunk: 100000\n").transfer.maxChunk == 65472);
    CHECK(attlog::config::parse_yaml("transfer:\n  max_chunk: 1\n").transfer.maxChunk == 1);
}

TEST_CASE("parse_yaml: malformed input throws")
{
    CHECK_THROWS(attlog::config::parse_yaml("device: [unterminated\n"));
    CHECK_THROWS(attlog::config::parse_yaml("device:\n  port: not-a-number\n"));
}

TEST_CASE("emit_yaml then parse_yaml preserves every field")
{
    AttlogConfig cfg;
    cfg.device.host = "10.0.0.7";
    cfg.device.port = 5005;
    cfg.device.readTimeoutMs = 12000;
    cfg.transfer.maxChunk = 4096;
    cfg.transfer.prepareSizeOffset = 1;
    cfg.clear.enabled = true;
    cfg.clear.threshold = 1;

    const AttlogConfig back = attlog::config::parse_yaml(attlog::config::emit_yaml(cfg));
    CHECK(configs_equal(cfg, back));
}

TEST_CASE("validate reports each problem")
{
    std::vector<std::string> errors;
    AttlogConfig cfg;
    CHECK_FALSE(attlog::config::validate(cfg, errors));
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("host") != std::string::npos);

    errors.clear();
    cfg.device.host = "terminal";
    cfg.device.port = 0;
    cfg.device.readTimeoutMs = 0;
    CHECK_FALSE(attlog::config::validate(cfg, errors));
    CHECK(errors.size() == 2);

    errors.clear();
    cfg.device.port = 4370;
    cfg.device.readTimeoutMs = 1000;
    cfg.transfer.prepareSizeOffset = 17;
    CHECK_FALSE(attlog::config::validate(cfg, errors));
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("prepare_size_offset") != std::string::npos);

    errors.clear();
    cfg.transfer.prepareSizeOffset = 1;
    CHECK(attlog::config::validate(cfg, errors));
    CHECK(errors.empty());
}

TEST_CASE("YamlAttlogConfigStore: missing file writes defaults")
{
    TempPath tmp("attlog-missing");

    YamlAttlogConfigStore store(tmp.path);
    const AttlogConfig cfg = store.load();

    CHECK(configs_equal(cfg, AttlogConfig{}));

    const std::string written = read_file(tmp.path);
    CHECK(written.find("device:") != std::string::npos);
    CHECK(written.find("threshold: 50000") != std::string::npos);
}

TEST_CASE("YamlAttlogConfigStore: save then load")
{
    TempPath tmp("attlog-save");

    AttlogConfig cfg;
    cfg.device.host = "192.168.50.2";
    cfg.clear.enabled = true;
    cfg.clear.threshold = 75000;

    YamlAttlogConfigStore store(tmp.path);
    store.save(cfg);

    CHECK(configs_equal(store.load(), cfg));
}

TEST_CASE("YamlAttlogConfigStore: unparsable file falls back to defaults")
{
    TempPath tmp("attlog-corrupt");
    write_file(tmp.path, "device: {host: [\n");

    YamlAttlogConfigStore store(tmp.path);
    CHECK(configs_equal(store.load(), AttlogConfig{}));

    // The broken file is left alone for the operator to fix.
    CHECK(read_file(tmp.path) == "device: {host: [\n");
}

TEST_CASE("YamlAttlogConfigStore: unwritable path throws on save")
{
    YamlAttlogConfigStore store("/nonexistent-dir/attlog.yaml");
    CHECK_THROWS_AS(store.save(AttlogConfig{}), std::runtime_error);
}
