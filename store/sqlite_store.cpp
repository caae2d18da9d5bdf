#include "sqlite_store.hpp"

#include "../audit/errors.hpp"
#include "../crypto/digest.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <vector>

namespace auditstore {

namespace {

class Statement {
public:
    Statement(sqlite3 *db, const char *sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    void bind(int idx, const std::string &s) {
        check(sqlite3_bind_text(stmt_, idx, s.c_str(), -1, SQLITE_TRANSIENT));
    }
    void bind(int idx, std::int64_t i) { check(sqlite3_bind_int64(stmt_, idx, i)); }
    void bind(int idx, double d) { check(sqlite3_bind_double(stmt_, idx, d)); }
    void bind_null(int idx) { check(sqlite3_bind_null(stmt_, idx)); }

    // True while rows are available.
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {
        }
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::string text(int col) const {
        const unsigned char *p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char *>(p) : std::string();
    }
    std::int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3 *db_;
    sqlite3_stmt *stmt_ = nullptr;
};

// Metadata paths are length-prefixed key segments ("4:user7:browser") so
// keys may contain any character.
std::string append_segment(const std::string &path, const std::string &key) {
    return path + std::to_string(key.size()) + ":" + key;
}

std::vector<std::string> split_path(const std::string &path) {
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos < path.size()) {
        const std::size_t colon = path.find(':', pos);
        if (colon == std::string::npos) {
            throw StorageError("corrupt metadata path: " + path);
        }
        const std::size_t len = std::strtoull(path.substr(pos, colon - pos).c_str(), nullptr, 10);
        if (colon + 1 + len > path.size()) {
            throw StorageError("corrupt metadata path: " + path);
        }
        out.push_back(path.substr(colon + 1, len));
        pos = colon + 1 + len;
    }
    return out;
}

struct FlatEntry {
    std::string path;
    ValueKind kind;
    Value value;
};

void flatten(const Object &obj, const std::string &prefix, std::vector<FlatEntry> &out) {
    for (const auto &entry : obj) {
        const std::string path = append_segment(prefix, entry.first);
        out.push_back(FlatEntry{path, entry.second.kind(), entry.second});
        if (entry.second.is_object()) {
            flatten(entry.second.as_object(), path, out);
        }
    }
}

void bind_flat_value(Statement &stmt, int idx, const Value &v) {
    char buf[32];
    switch (v.kind()) {
    case ValueKind::Null:
    case ValueKind::Object:
    case ValueKind::Array:
        stmt.bind_null(idx);
        return;
    case ValueKind::Bool:
        stmt.bind(idx, std::string(v.as_bool() ? "1" : "0"));
        return;
    case ValueKind::Integer:
        stmt.bind(idx, std::to_string(v.as_integer()));
        return;
    case ValueKind::Number:
        std::snprintf(buf, sizeof(buf), "%.17g", v.as_number());
        stmt.bind(idx, std::string(buf));
        return;
    case ValueKind::String:
        stmt.bind(idx, v.as_string());
        return;
    }
}

Value decode_flat_value(ValueKind kind, const std::string &text) {
    switch (kind) {
    case ValueKind::Null: return Value();
    case ValueKind::Bool: return Value(text == "1");
    case ValueKind::Integer: return Value(static_cast<std::int64_t>(std::strtoll(text.c_str(), nullptr, 10)));
    case ValueKind::Number: return Value(std::strtod(text.c_str(), nullptr));
    case ValueKind::String: return Value(text);
    case ValueKind::Object: return Value(Object{});
    case ValueKind::Array: return Value();
    }
    return Value();
}

// Walks (creating as needed) to the parent object of the path's last segment.
Object &parent_of(Object &root, const std::vector<std::string> &segments) {
    Object *cur = &root;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        Value &next = (*cur)[segments[i]];
        if (!next.is_object()) {
            next = Value(Object{});
        }
        cur = &next.as_object();
    }
    return *cur;
}

std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

SqliteHostStore::SqliteHostStore(const std::string &path) : path_(path) {
    if (sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                        nullptr) != SQLITE_OK) {
        const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("failed to open " + path_ + ": " + msg);
    }

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        create_schema();
    } catch (const StorageError &) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    spdlog::debug("opened audit store {}", path_);
}

SqliteHostStore::~SqliteHostStore() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

void SqliteHostStore::exec(const char *sql) {
    char *err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        const std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StorageError("SQL error in " + path_ + ": " + msg);
    }
}

void SqliteHostStore::create_schema() {
    exec(R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY,
            applied_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS events (
            key REAL PRIMARY KEY,
            event_id TEXT NOT NULL,
            timestamp_us INTEGER NOT NULL,
            user_id TEXT NOT NULL,
            action_type TEXT NOT NULL,
            outcome TEXT NOT NULL,
            ip_address TEXT NOT NULL,
            user_agent TEXT NOT NULL,
            checksum TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS event_metadata (
            event_key REAL NOT NULL,
            path TEXT NOT NULL,
            kind INTEGER NOT NULL,
            value TEXT,
            PRIMARY KEY (event_key, path)
        );

        CREATE TABLE IF NOT EXISTS container_meta (
            key TEXT PRIMARY KEY,
            value INTEGER
        );
    )");

    Statement version(db_, "INSERT OR IGNORE INTO schema_version (version, applied_at) VALUES (?1, ?2);");
    version.bind(1, static_cast<std::int64_t>(SCHEMA_VERSION));
    version.bind(2, unix_now());
    version.run();
}

void SqliteHostStore::begin() {
    exec("BEGIN IMMEDIATE;");
}

void SqliteHostStore::commit() {
    exec("COMMIT;");
}

void SqliteHostStore::rollback() {
    // A failed COMMIT may already have ended the transaction.
    if (sqlite3_get_autocommit(db_) == 0) {
        exec("ROLLBACK;");
    }
}

std::string SqliteHostStore::event_checksum(const Event &event) {
    return sha256_hex(to_json(event.to_dict()));
}

void SqliteHostStore::put_event(double key, const Event &event) {
    Statement insert(db_, R"(
        INSERT OR REPLACE INTO events (key, event_id, timestamp_us, user_id, action_type,
                            outcome, ip_address, user_agent, checksum)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9);
    )");
    insert.bind(1, key);
    insert.bind(2, event.event_id());
    insert.bind(3, to_epoch_micros(event.timestamp()));
    insert.bind(4, event.user_id());
    insert.bind(5, event.action_name());
    insert.bind(6, event.outcome_name());
    insert.bind(7, event.ip_address());
    insert.bind(8, event.user_agent());
    insert.bind(9, event_checksum(event));
    insert.run();

    // Drop rows left behind by an unreadable event that held this key.
    Statement stale(db_, "DELETE FROM event_metadata WHERE event_key = ?1;");
    stale.bind(1, key);
    stale.run();

    std::vector<FlatEntry> flat;
    flatten(event.metadata(), "", flat);
    if (flat.empty()) {
        return;
    }

    Statement meta(db_, "INSERT OR REPLACE INTO event_metadata (event_key, path, kind, value) VALUES (?1, ?2, ?3, ?4);");
    for (const auto &entry : flat) {
        meta.bind(1, key);
        meta.bind(2, entry.path);
        meta.bind(3, static_cast<std::int64_t>(entry.kind));
        bind_flat_value(meta, 4, entry.value);
        meta.run();
        meta.reset();
    }
}

void SqliteHostStore::erase_events_before(double cutoff_key) {
    Statement meta(db_, "DELETE FROM event_metadata WHERE event_key < ?1;");
    meta.bind(1, cutoff_key);
    meta.run();

    Statement events(db_, "DELETE FROM events WHERE key < ?1;");
    events.bind(1, cutoff_key);
    events.run();
}

void SqliteHostStore::put_metadata(const ContainerMetadata &meta) {
    Statement upsert(db_, "INSERT OR REPLACE INTO container_meta (key, value) VALUES (?1, ?2);");
    auto put = [&upsert](const char *name, std::int64_t value) {
        upsert.bind(1, std::string(name));
        upsert.bind(2, value);
        upsert.run();
        upsert.reset();
    };
    put("created", to_epoch_micros(meta.created));
    put("total_events", static_cast<std::int64_t>(meta.total_events));
    put("retention_days", static_cast<std::int64_t>(meta.retention_days));

    if (meta.last_cleaned) {
        put("last_cleaned", to_epoch_micros(*meta.last_cleaned));
    } else {
        Statement clear(db_, "DELETE FROM container_meta WHERE key = 'last_cleaned';");
        clear.run();
    }
}

Object SqliteHostStore::load_event_metadata(double key) {
    Statement select(db_, "SELECT path, kind, value FROM event_metadata WHERE event_key = ?1 ORDER BY path;");
    select.bind(1, key);

    Object root;
    while (select.step()) {
        const std::vector<std::string> segments = split_path(select.text(0));
        if (segments.empty()) {
            continue;
        }
        const std::int64_t raw_kind = select.int64(1);
        if (raw_kind < 0 || raw_kind > static_cast<std::int64_t>(ValueKind::Object)) {
            throw StorageError("corrupt metadata kind in " + path_);
        }
        const ValueKind kind = static_cast<ValueKind>(raw_kind);

        Object &parent = parent_of(root, segments);
        Value &slot = parent[segments.back()];
        // A nested object may already hold children added through parent_of.
        if (kind == ValueKind::Object && slot.is_object()) {
            continue;
        }
        slot = decode_flat_value(kind, select.is_null(2) ? std::string() : select.text(2));
    }
    return root;
}

bool SqliteHostStore::load(ContainerMetadata &meta, const EventVisitor &visit) {
    Statement select_meta(db_, "SELECT key, value FROM container_meta;");
    bool found = false;
    ContainerMetadata loaded;
    while (select_meta.step()) {
        const std::string name = select_meta.text(0);
        const std::int64_t value = select_meta.int64(1);
        if (name == "created") {
            loaded.created = from_epoch_micros(value);
            found = true;
        } else if (name == "last_cleaned") {
            loaded.last_cleaned = from_epoch_micros(value);
        } else if (name == "total_events") {
            loaded.total_events = static_cast<std::size_t>(value);
        } else if (name == "retention_days") {
            loaded.retention_days = static_cast<int>(value);
        }
    }
    if (!found) {
        return false;
    }
    meta = loaded;

    Statement select(db_, R"(
        SELECT key, event_id, timestamp_us, user_id, action_type, outcome,
               ip_address, user_agent, checksum
        FROM events ORDER BY key;
    )");
    std::size_t skipped = 0;
    while (select.step()) {
        const double key = select.real(0);
        const std::string event_id = select.text(1);
        try {
            Event event = Event::restore(event_id,
                                         from_epoch_micros(select.int64(2)),
                                         select.text(3),
                                         select.text(4),
                                         select.text(5),
                                         select.text(6),
                                         select.text(7),
                                         load_event_metadata(key));
            if (event_checksum(event) != select.text(8)) {
                spdlog::error("audit store {}: checksum mismatch for event {}, skipping",
                              path_, event_id);
                ++skipped;
                continue;
            }
            visit(key, std::move(event));
        } catch (const ValidationError &ex) {
            spdlog::error("audit store {}: invalid event {}: {}", path_, event_id, ex.what());
            ++skipped;
        }
    }

    if (skipped > 0) {
        spdlog::warn("audit store {}: skipped {} unreadable events", path_, skipped);
    }
    return true;
}

} // namespace auditstore
