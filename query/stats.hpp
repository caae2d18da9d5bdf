#pragma once

#include "../audit/timestamp.hpp"
#include "../audit/value.hpp"
#include "../store/index_container.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace auditstore {

struct AuditStats {
    ContainerStats container;
    std::map<std::string, std::size_t> recent_activity;
    std::size_t recent_events_24h = 0;
    std::size_t success_events = 0;
    std::size_t failure_events = 0;
    // Percentage rounded to two decimals; 0 without any event.
    double success_rate = 0.0;
    std::optional<std::string> error;

    Object to_dict() const;
    std::string to_json() const;
};

AuditStats get_audit_stats(const IndexContainer &container, Timestamp now = now_utc());

} // namespace auditstore
