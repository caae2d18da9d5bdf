#include "index_container.hpp"
#include "transaction.hpp"

#include "../audit/errors.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace auditstore {

Object ContainerStats::to_dict() const {
    Object out;
    out["total_events"] = total_events;
    out["created"] = to_iso8601(created);
    out["last_cleaned"] = last_cleaned ? Value(to_iso8601(*last_cleaned)) : Value();
    out["retention_days"] = retention_days;
    out["users_count"] = users_count;
    out["action_types_count"] = action_types_count;
    out["index_violations"] = index_violations;
    return out;
}

IndexContainer::PrimaryKey IndexContainer::to_primary_key(ScaledKey scaled) {
    return static_cast<double>(scaled) / 1000000.0;
}

IndexContainer::ScaledKey IndexContainer::to_scaled_key(PrimaryKey key) {
    return static_cast<ScaledKey>(std::llround(key * 1000000.0));
}

IndexContainer::IndexContainer(std::unique_ptr<HostStore> store) : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("IndexContainer requires a host store");
    }

    meta_.created = now_utc();
    const bool existing = store_->load(meta_, [this](PrimaryKey key, Event event) {
        auto inserted = primary_.emplace(key, std::move(event));
        if (!inserted.second) {
            spdlog::error("duplicate primary key {} in {}, keeping the first event",
                          key, store_->describe());
            return;
        }
        index_event(key, inserted.first->second, nullptr);
    });

    if (!existing) {
        Transaction txn(*store_);
        store_->put_metadata(meta_);
        txn.commit();
        spdlog::info("created audit log container ({})", store_->describe());
        return;
    }

    if (meta_.total_events != primary_.size()) {
        spdlog::warn("{}: stored total_events {} differs from {} loaded events",
                     store_->describe(), meta_.total_events, primary_.size());
        meta_.total_events = primary_.size();
    }
    spdlog::info("loaded audit log container ({}) with {} events",
                 store_->describe(), primary_.size());
}

std::string IndexContainer::add_event(Event event) {
    ScaledKey scaled = to_epoch_micros(event.timestamp());
    while (primary_.count(to_primary_key(scaled)) != 0) {
        ++scaled;
    }
    const PrimaryKey key = to_primary_key(scaled);
    const std::string event_id = event.event_id();

    Transaction txn(*store_);
    txn.on_rollback([this, key] { primary_.erase(key); });
    const Event &stored = primary_.emplace(key, std::move(event)).first->second;
    index_event(key, stored, &txn);

    txn.on_rollback([this, previous = meta_.total_events] { meta_.total_events = previous; });
    ++meta_.total_events;

    store_->put_event(key, stored);
    store_->put_metadata(meta_);
    txn.commit();

    spdlog::debug("added audit event {} ({}, {}, {})", event_id, stored.user_id(),
                  stored.action_name(), stored.outcome_name());
    return event_id;
}

void IndexContainer::index_event(PrimaryKey key, const Event &event, Transaction *txn) {
    const ScaledKey scaled = to_scaled_key(key);
    insert_entry(by_user_, event.user_id(), scaled, event.event_id(), txn);
    insert_entry(by_action_, event.action_name(), scaled, event.event_id(), txn);
    insert_entry(by_outcome_, event.outcome_name(), scaled, event.event_id(), txn);
}

void IndexContainer::unindex_event(PrimaryKey key, const Event &event, Transaction &txn) {
    const ScaledKey scaled = to_scaled_key(key);
    erase_entry(by_user_, "by_user", event.user_id(), scaled, txn);
    erase_entry(by_action_, "by_action", event.action_name(), scaled, txn);
    erase_entry(by_outcome_, "by_outcome", event.outcome_name(), scaled, txn);
}

void IndexContainer::insert_entry(SecondaryIndex &index, const std::string &value,
                                  ScaledKey scaled, const std::string &event_id,
                                  Transaction *txn) {
    if (txn) {
        txn->on_rollback([&index, value, scaled] {
            auto bucket = index.find(value);
            if (bucket == index.end()) return;
            bucket->second.erase(scaled);
            if (bucket->second.empty()) {
                index.erase(bucket);
            }
        });
    }
    index[value][scaled] = event_id;
}

void IndexContainer::erase_entry(SecondaryIndex &index, const char *index_name,
                                 const std::string &value, ScaledKey scaled,
                                 Transaction &txn) {
    auto bucket = index.find(value);
    auto entry = bucket == index.end() ? Bucket::iterator() : bucket->second.find(scaled);
    if (bucket == index.end() || entry == bucket->second.end()) {
        ++index_violations_;
        spdlog::error("{} index has no entry for '{}' at key {}", index_name, value, scaled);
        return;
    }

    txn.on_rollback([&index, value, scaled, event_id = entry->second] {
        index[value][scaled] = event_id;
    });
    bucket->second.erase(entry);
    if (bucket->second.empty()) {
        index.erase(bucket);
    }
}

std::vector<Event> IndexContainer::query_by_timestamp(std::optional<Timestamp> start,
                                                      std::optional<Timestamp> end) const {
    if (start && end && *start > *end) {
        return {};
    }
    auto first = start ? primary_.lower_bound(to_epoch_seconds(*start)) : primary_.begin();
    auto last = end ? primary_.upper_bound(to_epoch_seconds(*end)) : primary_.end();

    std::vector<Event> out;
    for (auto it = first; it != last; ++it) {
        out.push_back(it->second);
    }
    return out;
}

std::vector<Event> IndexContainer::query_by_user(const std::string &user_id,
                                                 std::optional<Timestamp> start,
                                                 std::optional<Timestamp> end) const {
    return query_index(by_user_, "by_user", user_id, start, end);
}

std::vector<Event> IndexContainer::query_by_action(const std::string &action_type,
                                                   std::optional<Timestamp> start,
                                                   std::optional<Timestamp> end) const {
    return query_index(by_action_, "by_action", action_type, start, end);
}

std::vector<Event> IndexContainer::query_by_outcome(const std::string &outcome,
                                                    std::optional<Timestamp> start,
                                                    std::optional<Timestamp> end) const {
    return query_index(by_outcome_, "by_outcome", outcome, start, end);
}

std::vector<Event> IndexContainer::query_index(const SecondaryIndex &index,
                                               const char *index_name,
                                               const std::string &value,
                                               std::optional<Timestamp> start,
                                               std::optional<Timestamp> end) const {
    auto bucket = index.find(value);
    if (bucket == index.end() || (start && end && *start > *end)) {
        return {};
    }

    const Bucket &keys = bucket->second;
    auto first = start ? keys.lower_bound(to_epoch_micros(*start)) : keys.begin();
    auto last = end ? keys.upper_bound(to_epoch_micros(*end)) : keys.end();

    std::vector<Event> out;
    for (auto it = first; it != last; ++it) {
        auto hit = primary_.find(to_primary_key(it->first));
        if (hit == primary_.end()) {
            // Skipped so readers still get every resolvable event; the
            // counter surfaces the desynchronization in get_stats().
            ++index_violations_;
            spdlog::error("{} index entry {} for '{}' (event {}) has no primary record",
                          index_name, it->first, value, it->second);
            continue;
        }
        out.push_back(hit->second);
    }
    return out;
}

std::size_t IndexContainer::cleanup_old_events(Timestamp cutoff) {
    const PrimaryKey cutoff_key = to_epoch_seconds(cutoff);

    Transaction txn(*store_);
    txn.on_rollback([this, previous = meta_] { meta_ = previous; });

    std::size_t deleted = 0;
    auto it = primary_.begin();
    while (it != primary_.end() && it->first < cutoff_key) {
        const PrimaryKey key = it->first;
        unindex_event(key, it->second, txn);
        txn.on_rollback([this, key, event = it->second] { primary_.emplace(key, event); });
        it = primary_.erase(it);
        ++deleted;
    }

    meta_.total_events = meta_.total_events >= deleted ? meta_.total_events - deleted : 0;
    meta_.last_cleaned = now_utc();

    store_->erase_events_before(cutoff_key);
    store_->put_metadata(meta_);
    txn.commit();

    spdlog::info("cleaned up {} audit events older than {}", deleted, to_iso8601(cutoff));
    return deleted;
}

ContainerStats IndexContainer::get_stats() const {
    ContainerStats stats;
    stats.total_events = meta_.total_events;
    stats.created = meta_.created;
    stats.last_cleaned = meta_.last_cleaned;
    stats.retention_days = meta_.retention_days;
    stats.users_count = by_user_.size();
    stats.action_types_count = by_action_.size();
    stats.index_violations = index_violations_;
    return stats;
}

void IndexContainer::set_retention_days(int days) {
    if (days < 1) {
        throw ValidationError("retention_days must be at least 1, got " + std::to_string(days));
    }

    Transaction txn(*store_);
    txn.on_rollback([this, previous = meta_.retention_days] { meta_.retention_days = previous; });
    meta_.retention_days = days;
    store_->put_metadata(meta_);
    txn.commit();
}

std::size_t IndexContainer::outcome_count(const std::string &outcome) const {
    auto bucket = by_outcome_.find(outcome);
    return bucket == by_outcome_.end() ? 0 : bucket->second.size();
}

std::vector<std::string> IndexContainer::verify_integrity() const {
    std::vector<std::string> problems;

    if (meta_.total_events != primary_.size()) {
        problems.push_back("total_events is " + std::to_string(meta_.total_events) +
                           " but primary holds " + std::to_string(primary_.size()));
    }

    auto expect_entry = [&problems](const SecondaryIndex &index, const char *name,
                                    const std::string &value, ScaledKey scaled,
                                    const std::string &event_id) {
        auto bucket = index.find(value);
        if (bucket == index.end()) {
            problems.push_back(std::string(name) + " has no bucket for '" + value + "'");
            return;
        }
        auto entry = bucket->second.find(scaled);
        if (entry == bucket->second.end()) {
            problems.push_back(std::string(name) + " is missing event " + event_id);
        } else if (entry->second != event_id) {
            problems.push_back(std::string(name) + " maps key " + std::to_string(scaled) +
                               " to " + entry->second + " instead of " + event_id);
        }
    };

    for (const auto &entry : primary_) {
        const ScaledKey scaled = to_scaled_key(entry.first);
        const Event &event = entry.second;
        if (to_primary_key(scaled) != entry.first) {
            problems.push_back("primary key of event " + event.event_id() +
                               " is not on the microsecond grid");
        }
        expect_entry(by_user_, "by_user", event.user_id(), scaled, event.event_id());
        expect_entry(by_action_, "by_action", event.action_name(), scaled, event.event_id());
        expect_entry(by_outcome_, "by_outcome", event.outcome_name(), scaled, event.event_id());
    }

    auto check_index = [this, &problems](const SecondaryIndex &index, const char *name) {
        std::size_t entries = 0;
        for (const auto &bucket : index) {
            if (bucket.second.empty()) {
                problems.push_back(std::string(name) + " keeps empty bucket '" + bucket.first + "'");
            }
            entries += bucket.second.size();
            for (const auto &entry : bucket.second) {
                if (primary_.count(to_primary_key(entry.first)) == 0) {
                    problems.push_back(std::string(name) + " entry for event " + entry.second +
                                       " has no primary record");
                }
            }
        }
        if (entries != primary_.size()) {
            problems.push_back(std::string(name) + " holds " + std::to_string(entries) +
                               " entries for " + std::to_string(primary_.size()) + " events");
        }
    };
    check_index(by_user_, "by_user");
    check_index(by_action_, "by_action");
    check_index(by_outcome_, "by_outcome");

    return problems;
}

} // namespace auditstore
