#pragma once

#include "host_store.hpp"

namespace auditstore {

// Non-durable store for ephemeral scopes and tests. Tracks transaction state
// so misuse (nested begin, commit without begin) is still detected.
class MemoryHostStore : public HostStore {
public:
    void begin() override;
    void commit() override;
    void rollback() override;

    void put_event(double key, const Event &event) override;
    void erase_events_before(double cutoff_key) override;
    void put_metadata(const ContainerMetadata &meta) override;

    bool load(ContainerMetadata &meta, const EventVisitor &visit) override;

    std::string describe() const override { return "memory"; }

    std::size_t commits() const { return commits_; }
    std::size_t rollbacks() const { return rollbacks_; }

private:
    void require_transaction(const char *op) const;

    bool in_transaction_ = false;
    std::size_t commits_ = 0;
    std::size_t rollbacks_ = 0;
};

} // namespace auditstore
