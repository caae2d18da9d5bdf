#include "protocol.hpp"

#include "../audit/audit_logger.hpp"
#include "../audit/errors.hpp"
#include "../audit/event.hpp"
#include "../query/cleanup.hpp"
#include "../query/export.hpp"
#include "../query/query.hpp"
#include "../query/stats.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <exception>
#include <limits>
#include <optional>

namespace auditstore {

namespace {

class JsonReader {
public:
    explicit JsonReader(const std::string &text) : text_(text) {}

    Request read_request() {
        Request req;
        skip_ws();
        expect('{');
        skip_ws();
        if (accept('}')) {
            finish();
            return req;
        }
        do {
            skip_ws();
            const std::string key = read_string();
            skip_ws();
            expect(':');
            skip_ws();
            if (peek() == '{') {
                if (key != "metadata") fail("unexpected object for '" + key + "'");
                req.metadata = read_flat_object();
            } else {
                Value v = read_scalar();
                if (v.is_null()) {
                    req.fields.erase(key);
                } else {
                    req.fields[key] = scalar_text(v);
                }
            }
            skip_ws();
        } while (accept(','));
        expect('}');
        finish();

        auto kind = req.fields.find("kind");
        if (kind == req.fields.end()) {
            fail("missing kind");
        }
        req.kind = kind->second;
        return req;
    }

private:
    Object read_flat_object() {
        Object out;
        expect('{');
        skip_ws();
        if (accept('}')) return out;
        do {
            skip_ws();
            const std::string key = read_string();
            skip_ws();
            expect(':');
            skip_ws();
            out[key] = read_scalar();
            skip_ws();
        } while (accept(','));
        expect('}');
        return out;
    }

    Value read_scalar() {
        const char c = peek();
        if (c == '"') return read_string();
        if (match("true")) return true;
        if (match("false")) return false;
        if (match("null")) return Value();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return read_number();
        fail("unexpected character");
    }

    Value read_number() {
        const std::size_t start = pos_;
        bool fractional = false;
        accept('-');
        while (!done()) {
            const char c = peek();
            if (std::isdigit(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
                fractional = true;
                ++pos_;
            } else {
                break;
            }
        }
        const std::string token = text_.substr(start, pos_ - start);
        char *end = nullptr;
        if (fractional) {
            const double d = std::strtod(token.c_str(), &end);
            if (end != token.c_str() + token.size()) fail("bad number " + token);
            return d;
        }
        const long long i = std::strtoll(token.c_str(), &end, 10);
        if (token == "-" || end != token.c_str() + token.size()) fail("bad number " + token);
        return static_cast<std::int64_t>(i);
    }

    std::string read_string() {
        expect('"');
        std::string out;
        while (true) {
            if (done()) fail("unterminated string");
            const char c = text_[pos_++];
            if (c == '"') break;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (done()) fail("unterminated escape");
            const char e = text_[pos_++];
            switch (e) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': append_utf8(out, read_hex4()); break;
            default: fail("bad escape");
            }
        }
        return out;
    }

    unsigned read_hex4() {
        if (pos_ + 4 > text_.size()) fail("short \\u escape");
        unsigned cp = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = text_[pos_++];
            cp <<= 4;
            if (c >= '0' && c <= '9') cp |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') cp |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') cp |= static_cast<unsigned>(c - 'A' + 10);
            else fail("bad \\u escape");
        }
        return cp;
    }

    // Surrogate pairs are not combined; each half is encoded on its own.
    static void append_utf8(std::string &out, unsigned cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    static std::string scalar_text(const Value &v) {
        switch (v.kind()) {
        case ValueKind::String: return v.as_string();
        case ValueKind::Bool: return v.as_bool() ? "true" : "false";
        case ValueKind::Integer: return std::to_string(v.as_integer());
        default: return to_json(v);
        }
    }

    bool match(const char *word) {
        const std::string w(word);
        if (text_.compare(pos_, w.size(), w) != 0) return false;
        pos_ += w.size();
        return true;
    }

    void skip_ws() {
        while (!done() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    void finish() {
        skip_ws();
        if (!done()) fail("trailing characters");
    }

    bool done() const { return pos_ >= text_.size(); }
    char peek() const { return done() ? '\0' : text_[pos_]; }

    bool accept(char c) {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    void expect(char c) {
        if (!accept(c)) fail(std::string("expected '") + c + "'");
    }

    [[noreturn]] void fail(const std::string &what) const {
        throw ValidationError("malformed request at offset " + std::to_string(pos_) + ": " + what);
    }

    const std::string &text_;
    std::size_t pos_ = 0;
};

std::string error_response(const std::string &error) {
    Object out;
    out["status"] = "ERROR";
    out["error"] = error;
    return to_json(out);
}

std::string response(RequestKind kind, const std::optional<std::string> &error, Object body) {
    body["kind"] = request_kind_to_string(kind);
    body["status"] = error ? "ERROR" : "OK";
    if (error) {
        body["error"] = *error;
    }
    return to_json(body);
}

std::optional<int> parse_days(const std::string &text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::size_t used = 0;
    int days = 0;
    try {
        days = std::stoi(text, &used);
    } catch (const std::exception &) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw ValidationError("invalid retention_days: " + text);
    }
    return days;
}

// The configured retention policy applies to every scope the daemon serves.
IndexContainer &open_scope(Registry &registry, const Config &cfg, const Request &req) {
    std::string scope = req.field("scope");
    if (scope.empty()) {
        scope = cfg.default_scope;
    }
    const bool opened = !registry.contains(scope);
    IndexContainer &container = registry.get_or_create(scope);
    if (opened && container.metadata().retention_days != cfg.retention_days) {
        container.set_retention_days(cfg.retention_days);
    }
    return container;
}

// A rejected event is the client's error and is answered as such; storage
// failures stay fail-open and come back as not_logged.
std::string handle_log(IndexContainer &container, const Request &req) {
    const std::string action_type = req.field("action_type");
    const std::string outcome = req.field("outcome");
    if (!is_valid_action_type(action_type)) {
        return response(RequestKind::Log, "invalid_event: Invalid action_type: " + action_type, Object());
    }
    if (!is_valid_outcome(outcome)) {
        return response(RequestKind::Log, "invalid_event: Invalid outcome: " + outcome, Object());
    }

    const std::optional<std::string> event_id =
        log_audit_event(container, req.field("user_id"), action_type, outcome,
                        req.field("ip_address"), req.field("user_agent"), req.metadata);
    Object body;
    if (!event_id) {
        return response(RequestKind::Log, std::string("not_logged"), body);
    }
    body["event_id"] = *event_id;
    return response(RequestKind::Log, std::nullopt, body);
}

std::string handle_query(const IndexContainer &container, const Config &cfg,
                         const Request &req, Timestamp now) {
    const QueryFilters filters = parse_filters(req.fields, now);
    const std::size_t limit = parse_limit(req.field("limit"), cfg.query_default_limit,
                                          cfg.query_max_limit);
    const std::size_t offset = parse_limit(req.field("offset"), 0,
                                           std::numeric_limits<std::size_t>::max());
    const QueryResult result = query_audit_logs(container, filters, limit, offset);

    Object body;
    body["result"] = result.to_dict();
    return response(RequestKind::Query, result.error, body);
}

std::string handle_export(const IndexContainer &container, const Config &cfg,
                          const Request &req, Timestamp now) {
    std::string format = req.field("format");
    if (format.empty()) {
        format = "csv";
    }
    const ExportResult result = export_audit_logs(container, format, parse_filters(req.fields, now),
                                                  cfg.export_max_events, now);
    Object body;
    body["content"] = result.content;
    body["content_type"] = result.content_type;
    body["filename"] = result.filename;
    return response(RequestKind::Export, result.error, body);
}

std::string handle_cleanup(IndexContainer &container, const Request &req, Timestamp now) {
    const CleanupResult result = cleanup_old_logs(container, parse_days(req.field("retention_days")), now);
    Object body;
    body["result"] = result.to_dict();
    return response(RequestKind::Cleanup, result.error, body);
}

std::string handle_stats(const IndexContainer &container, Timestamp now) {
    const AuditStats stats = get_audit_stats(container, now);
    Object body;
    body["result"] = stats.to_dict();
    return response(RequestKind::Stats, stats.error, body);
}

} // namespace

RequestKind request_kind_from_string(const std::string &s) {
    if (s == "LOG") return RequestKind::Log;
    if (s == "QUERY") return RequestKind::Query;
    if (s == "EXPORT") return RequestKind::Export;
    if (s == "CLEANUP") return RequestKind::Cleanup;
    if (s == "STATS") return RequestKind::Stats;
    throw ValidationError("unknown request kind: " + s);
}

std::string request_kind_to_string(RequestKind kind) {
    switch (kind) {
    case RequestKind::Log: return "LOG";
    case RequestKind::Query: return "QUERY";
    case RequestKind::Export: return "EXPORT";
    case RequestKind::Cleanup: return "CLEANUP";
    case RequestKind::Stats: return "STATS";
    }
    return "LOG";
}

std::string Request::field(const std::string &name) const {
    auto it = fields.find(name);
    return it == fields.end() ? std::string() : it->second;
}

Request parse_request_json(const std::string &line) {
    return JsonReader(line).read_request();
}

std::string handle_request_line(Registry &registry, const Config &cfg,
                                const std::string &line, Timestamp now) {
    Request req;
    RequestKind kind;
    try {
        req = parse_request_json(line);
    } catch (const ValidationError &ex) {
        spdlog::warn("Rejected request: {}", ex.what());
        return error_response(ex.what());
    }
    try {
        kind = request_kind_from_string(req.kind);
    } catch (const ValidationError &) {
        spdlog::warn("Unknown request kind: {}", req.kind);
        return error_response("unknown_kind");
    }

    try {
        IndexContainer &container = open_scope(registry, cfg, req);
        switch (kind) {
        case RequestKind::Log: return handle_log(container, req);
        case RequestKind::Query: return handle_query(container, cfg, req, now);
        case RequestKind::Export: return handle_export(container, cfg, req, now);
        case RequestKind::Cleanup: return handle_cleanup(container, req, now);
        case RequestKind::Stats: return handle_stats(container, now);
        }
    } catch (const std::exception &ex) {
        spdlog::error("{} request failed: {}", req.kind, ex.what());
        return response(kind, std::string(ex.what()), Object());
    }
    return error_response("unknown_kind");
}

} // namespace auditstore
