#pragma once

#include "host_store.hpp"

#include "../audit/event.hpp"
#include "../audit/timestamp.hpp"
#include "../audit/value.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace auditstore {

class Transaction;

struct ContainerStats {
    std::size_t total_events = 0;
    Timestamp created;
    std::optional<Timestamp> last_cleaned;
    int retention_days = kDefaultRetentionDays;
    std::size_t users_count = 0;
    std::size_t action_types_count = 0;
    std::size_t index_violations = 0;

    Object to_dict() const;
};

// Audit events with one primary and three secondary access paths.
//
//   primary     seconds-since-epoch key -> Event, ascending by time
//   by_user     user_id     -> (microsecond key -> event_id)
//   by_action   action_type -> (microsecond key -> event_id)
//   by_outcome  outcome     -> (microsecond key -> event_id)
//
// The microsecond key of an event is the integer its primary key was derived
// from (primary = micros / 1e6), so a secondary entry resolves to its
// primary entry bit-exactly. Secondary buckets exist only while non-empty.
//
// Every mutation runs inside a Transaction on the host store; if the store
// fails, the in-memory maps are restored before the exception propagates.
class IndexContainer {
public:
    using PrimaryKey = double;
    using ScaledKey = std::int64_t;
    using Bucket = std::map<ScaledKey, std::string>;
    using SecondaryIndex = std::map<std::string, Bucket>;

    // Rebuilds from the store when it already holds the scope, otherwise
    // initializes and persists fresh metadata.
    explicit IndexContainer(std::unique_ptr<HostStore> store);

    IndexContainer(const IndexContainer &) = delete;
    IndexContainer &operator=(const IndexContainer &) = delete;

    // Returns the event id. Same-instant events are kept in insertion order
    // by bumping the key one microsecond at a time until it is free.
    std::string add_event(Event event);

    // Inclusive bounds; an absent bound is open. Results ascend by key.
    std::vector<Event> query_by_timestamp(std::optional<Timestamp> start = std::nullopt,
                                          std::optional<Timestamp> end = std::nullopt) const;
    std::vector<Event> query_by_user(const std::string &user_id,
                                     std::optional<Timestamp> start = std::nullopt,
                                     std::optional<Timestamp> end = std::nullopt) const;
    std::vector<Event> query_by_action(const std::string &action_type,
                                       std::optional<Timestamp> start = std::nullopt,
                                       std::optional<Timestamp> end = std::nullopt) const;
    std::vector<Event> query_by_outcome(const std::string &outcome,
                                        std::optional<Timestamp> start = std::nullopt,
                                        std::optional<Timestamp> end = std::nullopt) const;

    // Deletes every event keyed before the cutoff; returns how many.
    std::size_t cleanup_old_events(Timestamp cutoff);

    ContainerStats get_stats() const;

    void set_retention_days(int days);

    const ContainerMetadata &metadata() const { return meta_; }
    std::size_t size() const { return primary_.size(); }
    std::size_t outcome_count(const std::string &outcome) const;
    const HostStore &store() const { return *store_; }

    // Lists every broken invariant; empty when primary, indexes and counters
    // agree.
    std::vector<std::string> verify_integrity() const;

    static PrimaryKey to_primary_key(ScaledKey scaled);
    static ScaledKey to_scaled_key(PrimaryKey key);

private:
    std::vector<Event> query_index(const SecondaryIndex &index,
                                   const char *index_name,
                                   const std::string &value,
                                   std::optional<Timestamp> start,
                                   std::optional<Timestamp> end) const;

    void index_event(PrimaryKey key, const Event &event, Transaction *txn);
    void unindex_event(PrimaryKey key, const Event &event, Transaction &txn);

    void insert_entry(SecondaryIndex &index, const std::string &value,
                      ScaledKey scaled, const std::string &event_id, Transaction *txn);
    void erase_entry(SecondaryIndex &index, const char *index_name,
                     const std::string &value, ScaledKey scaled, Transaction &txn);

    std::unique_ptr<HostStore> store_;
    std::map<PrimaryKey, Event> primary_;
    SecondaryIndex by_user_;
    SecondaryIndex by_action_;
    SecondaryIndex by_outcome_;
    ContainerMetadata meta_;
    mutable std::size_t index_violations_ = 0;
};

} // namespace auditstore
