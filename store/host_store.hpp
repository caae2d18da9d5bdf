#pragma once

#include "../audit/event.hpp"
#include "../audit/timestamp.hpp"

#include <cstddef>
#include <functional>
#include <optional>

namespace auditstore {

constexpr int kDefaultRetentionDays = 90;

struct ContainerMetadata {
    Timestamp created;
    std::optional<Timestamp> last_cleaned;
    std::size_t total_events = 0;
    int retention_days = kDefaultRetentionDays;
};

// Persistence collaborator behind an IndexContainer. The container keeps its
// ordered maps in memory and mirrors every mutation here inside one
// begin/commit pair; the store makes the mirrored writes durable and
// all-or-nothing.
class HostStore {
public:
    using EventVisitor = std::function<void(double key, Event event)>;

    virtual ~HostStore() = default;

    virtual void begin() = 0;
    virtual void commit() = 0;
    // Must leave the store as it was at begin(). Called from destructors.
    virtual void rollback() = 0;

    virtual void put_event(double key, const Event &event) = 0;
    virtual void erase_events_before(double cutoff_key) = 0;
    virtual void put_metadata(const ContainerMetadata &meta) = 0;

    // Replays persisted state in ascending key order. Returns false when the
    // scope has never been written, leaving meta untouched.
    virtual bool load(ContainerMetadata &meta, const EventVisitor &visit) = 0;

    virtual std::string describe() const = 0;
};

} // namespace auditstore
