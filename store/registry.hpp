#pragma once

#include "host_store.hpp"
#include "index_container.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace auditstore {

using StoreFactory = std::function<std::unique_ptr<HostStore>(const std::string &scope)>;

// Owns one IndexContainer per logical scope. Callers thread a Registry
// through explicitly; there is no process-wide instance.
class Registry {
public:
    explicit Registry(StoreFactory factory);

    Registry(const Registry &) = delete;
    Registry &operator=(const Registry &) = delete;

    // Idempotent: the first call for a scope opens (or rebuilds) its
    // container, later calls return the same instance.
    IndexContainer &get_or_create(const std::string &scope);

    bool contains(const std::string &scope) const;
    std::vector<std::string> scopes() const;

private:
    StoreFactory factory_;
    std::map<std::string, std::unique_ptr<IndexContainer>> containers_;
};

StoreFactory memory_store_factory();

// One "<scope>.sqlite" file per scope under data_dir; the directory is
// created on first use.
StoreFactory sqlite_store_factory(const std::string &data_dir);

// Maps a scope name onto a safe file stem. Names made only of
// [A-Za-z0-9._-] (and not only dots) are kept as they are; any other name
// is sanitized and suffixed with "~" and 16 hex digits of its SHA-256, so
// distinct scopes never share a file.
std::string scope_file_stem(const std::string &scope);

} // namespace auditstore
