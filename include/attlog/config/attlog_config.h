#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace attlog::config {

struct DeviceConfig {
    std::string   host;                    // terminal address, e.g. "192.168.1.201"
    std::uint16_t port{4370};
    int           connectTimeoutMs{5000};
    int           readTimeoutMs{30000};
    int           writeTimeoutMs{10000};
};

struct TransferConfig {
    std::uint32_t maxChunk{65472};         // clamped to 1..65472 on load
    std::uint32_t prepareSizeOffset{0};    // table size position in the prepare reply
};

struct ClearConfig {
    bool          enabled{false};
    std::uint32_t threshold{50000};        // clear only above this many records
};

struct AttlogConfig {
    DeviceConfig   device;
    TransferConfig transfer;
    ClearConfig    clear;
};

// Appends one message per problem; true when none were found.
bool validate(const AttlogConfig& cfg, std::vector<std::string>& errors);

// Abstract config store.
class AttlogConfigStore {
public:
    virtual ~AttlogConfigStore() = default;

    virtual AttlogConfig load() = 0;
    virtual void         save(const AttlogConfig& cfg) = 0;
};

} // namespace attlog::config
