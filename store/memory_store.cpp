#include "memory_store.hpp"

#include "../audit/errors.hpp"

namespace auditstore {

void MemoryHostStore::require_transaction(const char *op) const {
    if (!in_transaction_) {
        throw StorageError(std::string(op) + " outside of a transaction");
    }
}

void MemoryHostStore::begin() {
    if (in_transaction_) {
        throw StorageError("nested transaction");
    }
    in_transaction_ = true;
}

void MemoryHostStore::commit() {
    require_transaction("commit");
    in_transaction_ = false;
    ++commits_;
}

void MemoryHostStore::rollback() {
    if (in_transaction_) {
        in_transaction_ = false;
        ++rollbacks_;
    }
}

void MemoryHostStore::put_event(double, const Event &) {
    require_transaction("put_event");
}

void MemoryHostStore::erase_events_before(double) {
    require_transaction("erase_events_before");
}

void MemoryHostStore::put_metadata(const ContainerMetadata &) {
    require_transaction("put_metadata");
}

bool MemoryHostStore::load(ContainerMetadata &, const EventVisitor &) {
    return false;
}

} // namespace auditstore
