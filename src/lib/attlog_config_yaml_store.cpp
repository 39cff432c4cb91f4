#include "attlog/config/attlog_config_yaml_store.h"
#include "attlog/core/logging.h"
#include "attlog/protocol/command_ids.h"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace attlog::config {

static constexpr const char* TAG = "config";

static constexpr std::uint32_t MAX_PREPARE_SIZE_OFFSET = 16;

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    if (!obj || !obj.IsMap()) return def;
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, DeviceConfig& out)
{
    const DeviceConfig def{};
    out.host             = get_or<std::string>(node, "host", def.host);
    out.port             = get_or<std::uint16_t>(node, "port", def.port);
    out.connectTimeoutMs = get_or<int>(node, "connect_timeout_ms", def.connectTimeoutMs);
    out.readTimeoutMs    = get_or<int>(node, "read_timeout_ms", def.readTimeoutMs);
    out.writeTimeoutMs   = get_or<int>(node, "write_timeout_ms", def.writeTimeoutMs);
}

static void from_yaml(const YAML::Node& node, TransferConfig& out)
{
    const TransferConfig def{};
    out.prepareSizeOffset = get_or<std::uint32_t>(node, "prepare_size_offset", def.prepareSizeOffset);
    out.maxChunk = get_or<std::uint32_t>(node, "max_chunk", protocol::MAX_CHUNK);
    if (out.maxChunk == 0 || out.maxChunk > protocol::MAX_CHUNK) {
        AL_LOGW(TAG, "max_chunk %u out of range, using %u",
                (unsigned)out.maxChunk, (unsigned)protocol::MAX_CHUNK);
        out.maxChunk = protocol::MAX_CHUNK;
    }
}

static void from_yaml(const YAML::Node& node, ClearConfig& out)
{
    const ClearConfig def{};
    out.enabled   = get_or<bool>(node, "enabled", def.enabled);
    out.threshold = get_or<std::uint32_t>(node, "threshold", def.threshold);
}

static void from_yaml(const YAML::Node& root, AttlogConfig& cfg)
{
    from_yaml(root["device"], cfg.device);
    from_yaml(root["transfer"], cfg.transfer);
    from_yaml(root["clear"], cfg.clear);
}

// ---------- to_yaml helper ----------

static void to_yaml(YAML::Emitter& out, const AttlogConfig& cfg)
{
    out << YAML::BeginMap;

    out << YAML::Key << "device" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "host"               << YAML::Value << cfg.device.host;
    out << YAML::Key << "port"               << YAML::Value << cfg.device.port;
    out << YAML::Key << "connect_timeout_ms" << YAML::Value << cfg.device.connectTimeoutMs;
    out << YAML::Key << "read_timeout_ms"    << YAML::Value << cfg.device.readTimeoutMs;
    out << YAML::Key << "write_timeout_ms"   << YAML::Value << cfg.device.writeTimeoutMs;
    out << YAML::EndMap;

    out << YAML::Key << "transfer" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_chunk"           << YAML::Value << cfg.transfer.maxChunk;
    out << YAML::Key << "prepare_size_offset" << YAML::Value << cfg.transfer.prepareSizeOffset;
    out << YAML::EndMap;

    out << YAML::Key << "clear" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled"   << YAML::Value << cfg.clear.enabled;
    out << YAML::Key << "threshold" << YAML::Value << cfg.clear.threshold;
    out << YAML::EndMap;

    out << YAML::EndMap; // root
}

// ---------- public API ----------

bool validate(const AttlogConfig& cfg, std::vector<std::string>& errors)
{
    const std::size_t before = errors.size();

    if (cfg.device.host.empty())          errors.emplace_back("device.host is empty");
    if (cfg.device.port == 0)             errors.emplace_back("device.port must be non-zero");
    if (cfg.device.connectTimeoutMs <= 0) errors.emplace_back("device.connect_timeout_ms must be positive");
    if (cfg.device.readTimeoutMs <= 0)    errors.emplace_back("device.read_timeout_ms must be positive");
    if (cfg.device.writeTimeoutMs <= 0)   errors.emplace_back("device.write_timeout_ms must be positive");
    if (cfg.transfer.prepareSizeOffset > MAX_PREPARE_SIZE_OFFSET) {
        errors.emplace_back("transfer.prepare_size_offset must be at most " +
                            std::to_string(MAX_PREPARE_SIZE_OFFSET));
    }

    return errors.size() == before;
}

AttlogConfig parse_yaml(const std::string& text)
{
    AttlogConfig cfg{};
    if (text.empty()) {
        return cfg;
    }
    from_yaml(YAML::Load(text), cfg);
    return cfg;
}

std::string emit_yaml(const AttlogConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);
    return out.c_str();
}

YamlAttlogConfigStore::YamlAttlogConfigStore(std::string path)
    : _path(std::move(path))
{
}

AttlogConfig YamlAttlogConfigStore::load()
{
    std::ifstream in(_path);
    if (!in) {
        AL_LOGW(TAG, "Config '%s' not found; writing defaults", _path.c_str());
        AttlogConfig cfg{};
        try {
            save(cfg);
        } catch (const std::exception& ex) {
            AL_LOGE(TAG, "Failed to write default config '%s': %s", _path.c_str(), ex.what());
        }
        return cfg;
    }

    std::stringstream ss;
    ss << in.rdbuf();

    try {
        AttlogConfig cfg = parse_yaml(ss.str());
        AL_LOGI(TAG, "Loaded config from '%s'", _path.c_str());
        return cfg;
    } catch (const std::exception& ex) {
        AL_LOGE(TAG, "Failed to parse config '%s': %s; using defaults", _path.c_str(), ex.what());
        return AttlogConfig{};
    }
}

void YamlAttlogConfigStore::save(const AttlogConfig& cfg)
{
    const std::string text = emit_yaml(cfg);

    std::ofstream out(_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("open for write failed: " + _path);
    }
    out << text << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("short write while saving config: " + _path);
    }

    AL_LOGI(TAG, "Saved config to '%s'", _path.c_str());
}

} // namespace attlog::config
