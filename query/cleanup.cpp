#include "cleanup.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace auditstore {

Object CleanupResult::to_dict() const {
    Object out;
    if (error) {
        out["error"] = *error;
        out["deleted_count"] = 0;
        return out;
    }
    out["deleted_count"] = deleted_count;
    out["retention_days"] = retention_days;
    out["cutoff"] = cutoff ? Value(to_iso8601(*cutoff)) : Value();
    out["remaining_count"] = remaining_count;
    out["initial_count"] = initial_count;
    return out;
}

std::string CleanupResult::to_json() const {
    return auditstore::to_json(to_dict());
}

CleanupResult cleanup_old_logs(IndexContainer &container,
                               std::optional<int> retention_days,
                               Timestamp now) {
    CleanupResult result;
    try {
        const int days = retention_days ? *retention_days : container.metadata().retention_days;
        if (days <= 0) {
            spdlog::error("Refusing audit cleanup with retention_days={}", days);
            result.error = "retention_days must be positive, got " + std::to_string(days);
            return result;
        }

        const std::optional<Timestamp> cutoff = days_before(now, days);
        if (!cutoff) {
            spdlog::error("Refusing audit cleanup with retention_days={}: cutoff out of range", days);
            result.error = "retention_days out of range: " + std::to_string(days);
            return result;
        }
        result.retention_days = days;
        result.cutoff = cutoff;
        result.initial_count = container.size();
        result.deleted_count = container.cleanup_old_events(*cutoff);
        result.remaining_count = container.size();

        spdlog::info("Audit cleanup: deleted {} events older than {} days", result.deleted_count, days);
    } catch (const std::exception &ex) {
        spdlog::error("Error during audit log cleanup: {}", ex.what());
        result = CleanupResult();
        result.error = ex.what();
    }
    return result;
}

} // namespace auditstore
