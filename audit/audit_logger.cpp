#include "audit_logger.hpp"
#include "errors.hpp"
#include "event.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

namespace auditstore {

namespace {

bool iequals(const std::string &a, const std::string &b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

const std::string *RequestInfo::header(const std::string &name) const {
    for (const auto &entry : headers) {
        if (iequals(entry.first, name) && !entry.second.empty()) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::string RequestInfo::client_address() const {
    if (const std::string *forwarded = header("X-Forwarded-For")) {
        return *forwarded;
    }
    if (!remote_addr.empty()) {
        return remote_addr;
    }
    return kUnknownProvenance;
}

std::string RequestInfo::user_agent() const {
    if (const std::string *agent = header("User-Agent")) {
        return *agent;
    }
    return kUnknownProvenance;
}

std::optional<std::string> log_audit_event(IndexContainer &container,
                                           const std::string &user_id,
                                           const std::string &action_type,
                                           const std::string &outcome,
                                           const std::string &ip_address,
                                           const std::string &user_agent,
                                           Object metadata) {
    try {
        Event event(user_id, action_type, outcome, ip_address, user_agent, std::move(metadata));
        return container.add_event(std::move(event));
    } catch (const ValidationError &ex) {
        spdlog::error("Invalid audit event ({}, {}): {}", action_type, outcome, ex.what());
    } catch (const std::exception &ex) {
        spdlog::error("Failed to log audit event {} for {}: {}", action_type, user_id, ex.what());
    }
    return std::nullopt;
}

AuditLogger::AuditLogger(IndexContainer &container) : container_(container) {}

std::optional<std::string> AuditLogger::log_event(const std::string &user_id,
                                                  const std::string &action_type,
                                                  const std::string &outcome,
                                                  const RequestInfo &request,
                                                  Object metadata) const {
    return log_audit_event(container_, user_id, action_type, outcome,
                           request.client_address(), request.user_agent(),
                           std::move(metadata));
}

} // namespace auditstore
