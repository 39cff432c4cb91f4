#pragma once

#include <string>

#include "attlog/config/attlog_config.h"

namespace attlog::config {

// YAML text <-> config. parse_yaml throws YAML::Exception on malformed input.
AttlogConfig parse_yaml(const std::string& text);
std::string  emit_yaml(const AttlogConfig& cfg);

// File-backed YAML implementation of AttlogConfigStore.
//
// load() writes defaults when the file is missing and falls back to
// defaults (with an error log) when it cannot be parsed.
class YamlAttlogConfigStore : public AttlogConfigStore {
public:
    explicit YamlAttlogConfigStore(std::string path);

    AttlogConfig load() override;
    void         save(const AttlogConfig& cfg) override;

    const std::string& path() const { return _path; }

private:
    std::string _path;
};

} // namespace attlog::config
