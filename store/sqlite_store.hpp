#pragma once

#include "host_store.hpp"

#include <string>

struct sqlite3;

namespace auditstore {

// Durable store backed by one SQLite database per scope.
//
// Layout:
//   events          one row per event, keyed by the container's primary key
//   event_metadata  the metadata bag flattened to (path, kind, value) rows,
//                   keyed by the owning event's primary key
//   container_meta  created / last_cleaned / total_events / retention_days
//   schema_version  migration marker
//
// Every event row carries a SHA-256 checksum over its serialized record.
// Rows whose checksum no longer matches are reported and skipped on load.
class SqliteHostStore : public HostStore {
public:
    static const int SCHEMA_VERSION = 1;

    explicit SqliteHostStore(const std::string &path);
    ~SqliteHostStore() override;

    SqliteHostStore(const SqliteHostStore &) = delete;
    SqliteHostStore &operator=(const SqliteHostStore &) = delete;

    void begin() override;
    void commit() override;
    void rollback() override;

    void put_event(double key, const Event &event) override;
    void erase_events_before(double cutoff_key) override;
    void put_metadata(const ContainerMetadata &meta) override;

    bool load(ContainerMetadata &meta, const EventVisitor &visit) override;

    std::string describe() const override { return "sqlite:" + path_; }

    const std::string &path() const { return path_; }

    // Checksum stored alongside each event row.
    static std::string event_checksum(const Event &event);

private:
    void exec(const char *sql);
    void create_schema();
    Object load_event_metadata(double key);

    std::string path_;
    sqlite3 *db_ = nullptr;
};

} // namespace auditstore
