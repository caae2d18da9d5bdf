#pragma once

#include "../audit/timestamp.hpp"
#include "../audit/value.hpp"
#include "../policy/config.hpp"
#include "../store/registry.hpp"

#include <map>
#include <string>

namespace auditstore {

enum class RequestKind {
    Log,
    Query,
    Export,
    Cleanup,
    Stats
};

// Throws ValidationError for anything but LOG, QUERY, EXPORT, CLEANUP, STATS.
RequestKind request_kind_from_string(const std::string &s);
std::string request_kind_to_string(RequestKind kind);

// One request line: a JSON object whose members are scalars, plus an
// optional "metadata" object of scalars (LOG only).
struct Request {
    std::string kind;
    // Scalars rendered as text: strings verbatim, numbers as written,
    // true/false, null dropped.
    std::map<std::string, std::string> fields;
    Object metadata;

    std::string field(const std::string &name) const;
};

// Throws ValidationError on malformed JSON, nested arrays, or a missing kind.
Request parse_request_json(const std::string &line);

// Answers one request line with one JSON line (no trailing newline). Never
// throws: failures become {"status":"ERROR","error":...}.
std::string handle_request_line(Registry &registry,
                                const Config &cfg,
                                const std::string &line,
                                Timestamp now = now_utc());

} // namespace auditstore
