#pragma once

#include "value.hpp"

#include "../store/index_container.hpp"

#include <map>
#include <optional>
#include <string>

namespace auditstore {

// Provenance of the request that triggered an audited action.
struct RequestInfo {
    // HTTP header name -> value; names are matched case-insensitively.
    std::map<std::string, std::string> headers;
    std::string remote_addr;

    // X-Forwarded-For when present, then the peer address, else "unknown".
    std::string client_address() const;
    // User-Agent header, "unknown" when absent.
    std::string user_agent() const;

    const std::string *header(const std::string &name) const;
};

// Records one event in the container. Audit logging must never break the
// operation it observes: validation and storage failures are logged and
// reported as nullopt instead of thrown.
std::optional<std::string> log_audit_event(IndexContainer &container,
                                           const std::string &user_id,
                                           const std::string &action_type,
                                           const std::string &outcome,
                                           const std::string &ip_address,
                                           const std::string &user_agent,
                                           Object metadata = {});

class AuditLogger {
public:
    explicit AuditLogger(IndexContainer &container);

    std::optional<std::string> log_event(const std::string &user_id,
                                         const std::string &action_type,
                                         const std::string &outcome,
                                         const RequestInfo &request,
                                         Object metadata = {}) const;

private:
    IndexContainer &container_;
};

} // namespace auditstore
