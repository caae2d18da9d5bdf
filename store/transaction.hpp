#pragma once

#include "host_store.hpp"

#include <functional>
#include <vector>

namespace auditstore {

// Commit boundary around one mutating container operation. In-memory
// changes register an undo action before they are applied; unless commit()
// succeeds, the destructor rolls the host store back and replays the undo
// actions newest first, so neither side ever keeps a partial update.
class Transaction {
public:
    explicit Transaction(HostStore &store);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void on_rollback(std::function<void()> undo);
    void commit();

private:
    HostStore &store_;
    std::vector<std::function<void()>> undo_;
    bool committed_ = false;
};

} // namespace auditstore
