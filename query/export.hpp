#pragma once

#include "query.hpp"

#include "../audit/event.hpp"
#include "../audit/timestamp.hpp"
#include "../store/index_container.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace auditstore {

constexpr std::size_t kDefaultExportMaxEvents = 100000;

struct ExportResult {
    std::string content;
    std::string content_type;
    std::string filename;
    std::optional<std::string> error;
};

// Serializes the whole filtered set, most recent first. format is "csv" or
// "json"; anything else, a set larger than max_events, or a failure while
// reading yields a JSON {"error": ...} document named error_<stamp>.json.
ExportResult export_audit_logs(const IndexContainer &container,
                               const std::string &format,
                               const QueryFilters &filters = QueryFilters(),
                               std::size_t max_events = kDefaultExportMaxEvents,
                               Timestamp now = now_utc());

// Header plus one row per event, CRLF terminated. Fields are quoted only
// when they contain a delimiter, a quote or a line break. No events gives
// an empty string.
std::string events_to_csv(const std::vector<Event> &events);

// {"export_time": ..., "event_count": N, "events": [...]} indented by two.
std::string events_to_json(const std::vector<Event> &events, Timestamp export_time);

} // namespace auditstore
