#include "transaction.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace auditstore {

Transaction::Transaction(HostStore &store) : store_(store) {
    store_.begin();
}

Transaction::~Transaction() {
    if (committed_) {
        return;
    }
    try {
        store_.rollback();
    } catch (const std::exception &ex) {
        spdlog::error("rollback of {} store failed: {}", store_.describe(), ex.what());
    }
    // A failed undo leaves memory and disk out of step, but the remaining
    // actions still run and the destructor must not throw.
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
        try {
            (*it)();
        } catch (const std::exception &ex) {
            spdlog::critical("undo action for {} store failed: {}", store_.describe(), ex.what());
        }
    }
}

void Transaction::on_rollback(std::function<void()> undo) {
    undo_.push_back(std::move(undo));
}

void Transaction::commit() {
    store_.commit();
    committed_ = true;
    undo_.clear();
}

} // namespace auditstore
