#include "export.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iterator>
#include <sstream>

namespace auditstore {

namespace {

const char *const kCsvColumns[] = {
    "event_id", "timestamp", "user_id", "action_type",
    "outcome", "ip_address", "user_agent", "metadata",
};

std::string csv_field(const std::string &field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void write_csv_row(std::ostringstream &out, const std::vector<std::string> &fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i != 0) out << ',';
        out << csv_field(fields[i]);
    }
    out << "\r\n";
}

ExportResult error_result(const std::string &message, Timestamp now) {
    Object body;
    body["error"] = message;

    ExportResult result;
    result.content = to_json(body);
    result.content_type = "application/json";
    result.filename = "error_" + to_compact_stamp(now) + ".json";
    result.error = message;
    return result;
}

} // namespace

std::string events_to_csv(const std::vector<Event> &events) {
    if (events.empty()) {
        return "";
    }

    std::ostringstream out;
    write_csv_row(out, std::vector<std::string>(std::begin(kCsvColumns), std::end(kCsvColumns)));
    for (const auto &event : events) {
        write_csv_row(out, {
            event.event_id(),
            to_iso8601(event.timestamp()),
            event.user_id(),
            event.action_name(),
            event.outcome_name(),
            event.ip_address(),
            event.user_agent(),
            to_json(event.metadata(), -1, true),
        });
    }
    return out.str();
}

std::string events_to_json(const std::vector<Event> &events, Timestamp export_time) {
    Array records;
    records.reserve(events.size());
    for (const auto &event : events) {
        records.push_back(event.to_dict());
    }

    Object envelope;
    envelope["export_time"] = to_iso8601(export_time);
    envelope["event_count"] = events.size();
    envelope["events"] = std::move(records);
    return to_json(envelope, 2);
}

ExportResult export_audit_logs(const IndexContainer &container,
                               const std::string &format,
                               const QueryFilters &filters,
                               std::size_t max_events,
                               Timestamp now) {
    if (format != "csv" && format != "json") {
        spdlog::warn("Unsupported export format: {}", format);
        return error_result("Unsupported format: " + format, now);
    }

    try {
        const std::vector<Event> events = select_events(container, filters);
        if (events.size() > max_events) {
            spdlog::warn("Refusing to export {} audit events (limit {})", events.size(), max_events);
            return error_result("Export of " + std::to_string(events.size()) +
                                    " events exceeds the limit of " + std::to_string(max_events),
                                now);
        }

        ExportResult result;
        const std::string stamp = to_compact_stamp(now);
        if (format == "csv") {
            result.content = events_to_csv(events);
            result.content_type = "text/csv";
            result.filename = "audit_log_" + stamp + ".csv";
        } else {
            result.content = events_to_json(events, now);
            result.content_type = "application/json";
            result.filename = "audit_log_" + stamp + ".json";
        }
        spdlog::info("Exported {} audit events as {}", events.size(), format);
        return result;
    } catch (const std::exception &ex) {
        spdlog::error("Error exporting audit logs: {}", ex.what());
        return error_result(ex.what(), now);
    }
}

} // namespace auditstore
