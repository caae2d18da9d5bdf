#pragma once

#include "../audit/timestamp.hpp"
#include "../audit/value.hpp"
#include "../store/index_container.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace auditstore {

struct CleanupResult {
    std::size_t deleted_count = 0;
    int retention_days = 0;
    std::optional<Timestamp> cutoff;
    std::size_t remaining_count = 0;
    std::size_t initial_count = 0;
    std::optional<std::string> error;

    Object to_dict() const;
    std::string to_json() const;
};

// Removes every event older than now - retention_days. Without an explicit
// value the container's retention policy applies. Non-positive values and
// storage failures are reported in CleanupResult::error.
CleanupResult cleanup_old_logs(IndexContainer &container,
                               std::optional<int> retention_days = std::nullopt,
                               Timestamp now = now_utc());

} // namespace auditstore
