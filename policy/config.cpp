#include "config.hpp"

#include "../audit/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

namespace auditstore {

const char *const kDefaultConfigPath = "/etc/auditstore/auditstored.yaml";

namespace {

template <typename T>
void read_key(const YAML::Node &root, const char *key, T &out) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return;
    }
    try {
        out = node.as<T>();
    } catch (const YAML::Exception &ex) {
        throw ValidationError(std::string("config key '") + key + "': " + ex.what());
    }
}

void require_positive(long long value, const char *key) {
    if (value <= 0) {
        throw ValidationError(std::string("config key '") + key + "' must be positive");
    }
}

} // namespace

Config load_config(const std::string &path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &ex) {
        throw ValidationError("cannot load config " + path + ": " + ex.what());
    }

    Config cfg;
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw ValidationError("config " + path + " is not a mapping");
    }

    read_key(root, "socket_path", cfg.socket_path);
    read_key(root, "data_dir", cfg.data_dir);
    read_key(root, "backend", cfg.backend);
    read_key(root, "default_scope", cfg.default_scope);
    read_key(root, "retention_days", cfg.retention_days);
    read_key(root, "query_default_limit", cfg.query_default_limit);
    read_key(root, "query_max_limit", cfg.query_max_limit);
    read_key(root, "export_max_events", cfg.export_max_events);
    read_key(root, "log_level", cfg.log_level);
    read_key(root, "log_path", cfg.log_path);

    if (cfg.backend != "sqlite" && cfg.backend != "memory") {
        throw ValidationError("unknown backend: " + cfg.backend);
    }
    if (cfg.default_scope.empty()) {
        throw ValidationError("config key 'default_scope' must not be empty");
    }
    require_positive(cfg.retention_days, "retention_days");
    require_positive(static_cast<long long>(cfg.query_max_limit), "query_max_limit");
    require_positive(static_cast<long long>(cfg.export_max_events), "export_max_events");
    if (cfg.query_default_limit > cfg.query_max_limit) {
        cfg.query_default_limit = cfg.query_max_limit;
    }
    return cfg;
}

Config load_config_or_default() {
    if (std::filesystem::exists(kDefaultConfigPath)) {
        return load_config(kDefaultConfigPath);
    }
    return Config();
}

} // namespace auditstore
