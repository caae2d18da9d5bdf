#include "stats.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <exception>

namespace auditstore {

Object AuditStats::to_dict() const {
    if (error) {
        Object out;
        out["error"] = *error;
        return out;
    }

    Object out = container.to_dict();
    Object activity;
    for (const auto &entry : recent_activity) {
        activity[entry.first] = entry.second;
    }
    out["recent_activity"] = std::move(activity);
    out["recent_events_24h"] = recent_events_24h;
    out["success_events"] = success_events;
    out["failure_events"] = failure_events;
    out["success_rate"] = success_rate;
    return out;
}

std::string AuditStats::to_json() const {
    return auditstore::to_json(to_dict());
}

AuditStats get_audit_stats(const IndexContainer &container, Timestamp now) {
    AuditStats stats;
    try {
        stats.container = container.get_stats();

        for (const auto &event : container.query_by_timestamp(now - std::chrono::hours(24), now)) {
            ++stats.recent_activity[event.action_name()];
            ++stats.recent_events_24h;
        }

        stats.success_events = container.outcome_count(outcome_to_string(Outcome::Success));
        stats.failure_events = container.outcome_count(outcome_to_string(Outcome::Failure));
        const std::size_t decided = stats.success_events + stats.failure_events;
        if (decided > 0) {
            const double rate = static_cast<double>(stats.success_events) / decided * 100.0;
            stats.success_rate = std::round(rate * 100.0) / 100.0;
        }
    } catch (const std::exception &ex) {
        spdlog::error("Error getting audit stats: {}", ex.what());
        stats = AuditStats();
        stats.error = ex.what();
    }
    return stats;
}

} // namespace auditstore
