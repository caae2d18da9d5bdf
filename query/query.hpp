#pragma once

#include "../audit/event.hpp"
#include "../audit/timestamp.hpp"
#include "../audit/value.hpp"
#include "../store/index_container.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace auditstore {

struct QueryFilters {
    std::optional<std::string> user_id;
    std::optional<std::string> action_type;
    std::optional<std::string> outcome;
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> end_time;

    // Checks the user/action/outcome dimensions only; the time range is
    // enforced by the index lookup.
    bool matches(const Event &event) const;
};

struct QueryResult {
    std::vector<Object> events;
    std::size_t total = 0;
    std::size_t offset = 0;
    std::optional<std::size_t> limit;
    bool has_more = false;
    std::optional<std::string> error;

    Object to_dict() const;
    std::string to_json() const;
};

// Every event matching the filters, most recent first. Uses one index,
// chosen by precedence user_id > action_type > outcome > time range, and
// AND-filters the remaining dimensions in memory.
std::vector<Event> select_events(const IndexContainer &container, const QueryFilters &filters);

// Paginated view of select_events(). total counts the whole filtered set;
// an absent limit returns everything from offset on. Never throws: failures
// come back in QueryResult::error.
QueryResult query_audit_logs(const IndexContainer &container,
                             const QueryFilters &filters = QueryFilters(),
                             std::optional<std::size_t> limit = std::nullopt,
                             std::size_t offset = 0);

// Builds filters from request-style string parameters:
//   user_id, action_type    taken as given when non-empty
//   outcome                 only "success" or "failure"
//   start_date, end_date    ISO-8601 ("Z" or numeric offset)
//   days                    start_time = now - days, unless start_date is set
// Unparseable values are logged and ignored.
QueryFilters parse_filters(const std::map<std::string, std::string> &params, Timestamp now);

// Non-negative integer parameter clamped to max_value; default on garbage.
std::size_t parse_limit(const std::string &value, std::size_t default_value, std::size_t max_value);

} // namespace auditstore
