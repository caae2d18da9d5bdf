#pragma once

#include <cstddef>
#include <string>

namespace auditstore {

struct Config {
    std::string socket_path = "/run/auditstored.sock";
    std::string data_dir = "/var/lib/auditstore";
    // "sqlite" keeps one database per scope under data_dir; "memory" keeps
    // nothing across restarts.
    std::string backend = "sqlite";
    std::string default_scope = "default";
    int retention_days = 90;
    std::size_t query_default_limit = 100;
    std::size_t query_max_limit = 1000;
    std::size_t export_max_events = 100000;
    std::string log_level = "info";
    // Empty logs to stderr only.
    std::string log_path;
};

extern const char *const kDefaultConfigPath;

// Reads a YAML mapping; missing keys keep their defaults, unknown keys are
// ignored. Throws ValidationError for unreadable files and bad values.
Config load_config(const std::string &path);

// load_config(kDefaultConfigPath) when that file exists, defaults otherwise.
Config load_config_or_default();

} // namespace auditstore
