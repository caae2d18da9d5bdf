#include "query.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace auditstore {

namespace {

const std::string *param(const std::map<std::string, std::string> &params, const char *name) {
    auto it = params.find(name);
    if (it == params.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<Timestamp> parse_date_param(const char *name, const std::string &value) {
    try {
        return parse_iso8601(value);
    } catch (const std::exception &) {
        spdlog::warn("Invalid {} format: {}", name, value);
        return std::nullopt;
    }
}

std::optional<long long> parse_integer(const std::string &value) {
    std::size_t used = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &used);
    } catch (const std::exception &) {
        return std::nullopt;
    }
    if (used != value.size()) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace

bool QueryFilters::matches(const Event &event) const {
    if (user_id && event.user_id() != *user_id) return false;
    if (action_type && event.action_name() != *action_type) return false;
    if (outcome && event.outcome_name() != *outcome) return false;
    return true;
}

Object QueryResult::to_dict() const {
    Object out;
    out["events"] = Array(events.begin(), events.end());
    out["total"] = total;
    out["offset"] = offset;
    out["limit"] = limit ? Value(*limit) : Value();
    out["has_more"] = has_more;
    if (error) {
        out["error"] = *error;
    }
    return out;
}

std::string QueryResult::to_json() const {
    return auditstore::to_json(to_dict());
}

std::vector<Event> select_events(const IndexContainer &container, const QueryFilters &filters) {
    std::vector<Event> events;
    if (filters.user_id) {
        events = container.query_by_user(*filters.user_id, filters.start_time, filters.end_time);
    } else if (filters.action_type) {
        events = container.query_by_action(*filters.action_type, filters.start_time, filters.end_time);
    } else if (filters.outcome) {
        events = container.query_by_outcome(*filters.outcome, filters.start_time, filters.end_time);
    } else {
        events = container.query_by_timestamp(filters.start_time, filters.end_time);
    }

    events.erase(std::remove_if(events.begin(), events.end(),
                                [&filters](const Event &e) { return !filters.matches(e); }),
                 events.end());

    // Indexes yield ascending order; stable so same-instant events keep
    // their insertion order.
    std::stable_sort(events.begin(), events.end(), [](const Event &a, const Event &b) {
        return a.timestamp() > b.timestamp();
    });
    return events;
}

QueryResult query_audit_logs(const IndexContainer &container,
                             const QueryFilters &filters,
                             std::optional<std::size_t> limit,
                             std::size_t offset) {
    QueryResult result;
    result.limit = limit;
    try {
        const std::vector<Event> events = select_events(container, filters);

        result.total = events.size();
        result.offset = offset;

        const std::size_t begin = std::min(offset, events.size());
        const std::size_t end = limit && *limit < events.size() - begin ? begin + *limit : events.size();
        result.events.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            result.events.push_back(events[i].to_dict());
        }
        result.has_more = offset + result.events.size() < result.total;
    } catch (const std::exception &ex) {
        spdlog::error("Error querying audit logs: {}", ex.what());
        result.events.clear();
        result.total = 0;
        result.offset = 0;
        result.has_more = false;
        result.error = ex.what();
    }
    return result;
}

QueryFilters parse_filters(const std::map<std::string, std::string> &params, Timestamp now) {
    QueryFilters filters;

    if (const std::string *v = param(params, "user_id")) {
        filters.user_id = *v;
    }
    if (const std::string *v = param(params, "action_type")) {
        filters.action_type = *v;
    }
    if (const std::string *v = param(params, "outcome")) {
        if (is_valid_outcome(*v)) {
            filters.outcome = *v;
        } else {
            spdlog::warn("Ignoring outcome filter: {}", *v);
        }
    }

    const std::string *start_date = param(params, "start_date");
    if (start_date) {
        filters.start_time = parse_date_param("start_date", *start_date);
    }
    if (const std::string *v = param(params, "end_date")) {
        filters.end_time = parse_date_param("end_date", *v);
    }
    if (const std::string *v = param(params, "days")) {
        if (!start_date) {
            const std::optional<long long> days = parse_integer(*v);
            const std::optional<Timestamp> start = days ? days_before(now, *days) : std::nullopt;
            if (start) {
                filters.start_time = start;
            } else {
                spdlog::warn("Invalid days parameter: {}", *v);
            }
        }
    }
    return filters;
}

std::size_t parse_limit(const std::string &value, std::size_t default_value, std::size_t max_value) {
    if (value.empty()) {
        return default_value;
    }
    const std::optional<long long> parsed = parse_integer(value);
    if (!parsed) {
        spdlog::warn("Invalid limit parameter: {}", value);
        return default_value;
    }
    if (*parsed < 0) {
        return 0;
    }
    return std::min(static_cast<std::size_t>(*parsed), max_value);
}

} // namespace auditstore
