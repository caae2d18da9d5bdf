#include "event.hpp"
#include "errors.hpp"

#include "../crypto/random.hpp"

#include <utility>

namespace auditstore {

const char *const kAnonymousUser = "anonymous";
const char *const kUnknownProvenance = "unknown";

namespace {

struct ActionName {
    ActionType type;
    const char *name;
};

const ActionName kActionNames[] = {
    {ActionType::RegistrationStart, "registration_start"},
    {ActionType::RegistrationSuccess, "registration_success"},
    {ActionType::RegistrationFailure, "registration_failure"},
    {ActionType::AuthenticationStart, "authentication_start"},
    {ActionType::AuthenticationSuccess, "authentication_success"},
    {ActionType::AuthenticationFailure, "authentication_failure"},
    {ActionType::CredentialDeleted, "credential_deleted"},
    {ActionType::CredentialUpdated, "credential_updated"},
    {ActionType::Aal2TimestampSet, "aal2_timestamp_set"},
    {ActionType::Aal2AccessGranted, "aal2_access_granted"},
    {ActionType::Aal2AccessDenied, "aal2_access_denied"},
    {ActionType::Aal2PolicySet, "aal2_policy_set"},
    {ActionType::Aal2RoleAssigned, "aal2_role_assigned"},
    {ActionType::Aal2RoleRevoked, "aal2_role_revoked"},
};

std::string or_default(const std::string &value, const char *fallback) {
    return value.empty() ? std::string(fallback) : value;
}

// Metadata holds scalars and nested maps only.
void validate_metadata(const Object &metadata) {
    for (const auto &entry : metadata) {
        if (entry.second.is_array()) {
            throw ValidationError("Invalid metadata value for '" + entry.first + "': arrays are not supported");
        }
        if (entry.second.is_object()) {
            validate_metadata(entry.second.as_object());
        }
    }
}

} // namespace

ActionType action_type_from_string(const std::string &s) {
    for (const auto &entry : kActionNames) {
        if (s == entry.name) return entry.type;
    }
    throw ValidationError("Invalid action_type: " + s);
}

std::string action_type_to_string(ActionType type) {
    for (const auto &entry : kActionNames) {
        if (entry.type == type) return entry.name;
    }
    return "registration_start";
}

Outcome outcome_from_string(const std::string &s) {
    if (s == "success") return Outcome::Success;
    if (s == "failure") return Outcome::Failure;
    throw ValidationError("Invalid outcome: " + s);
}

std::string outcome_to_string(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success: return "success";
    case Outcome::Failure: return "failure";
    }
    return "success";
}

bool is_valid_action_type(const std::string &s) {
    for (const auto &entry : kActionNames) {
        if (s == entry.name) return true;
    }
    return false;
}

bool is_valid_outcome(const std::string &s) {
    return s == "success" || s == "failure";
}

const std::vector<std::string> &action_types() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto &entry : kActionNames) {
            out.emplace_back(entry.name);
        }
        return out;
    }();
    return names;
}

Event::Event(const std::string &user_id,
             const std::string &action_type,
             const std::string &outcome,
             const std::string &ip_address,
             const std::string &user_agent,
             Object metadata)
    : Event(now_utc(), user_id, action_type, outcome, ip_address, user_agent,
            std::move(metadata)) {}

Event::Event(Timestamp timestamp,
             const std::string &user_id,
             const std::string &action_type,
             const std::string &outcome,
             const std::string &ip_address,
             const std::string &user_agent,
             Object metadata)
    : Event(std::string(), timestamp, user_id, action_type, outcome, ip_address,
            user_agent, std::move(metadata)) {
    // Assigned after validation so a rejected event never consumes randomness.
    event_id_ = random_uuid();
}

Event Event::restore(const std::string &event_id,
                     Timestamp timestamp,
                     const std::string &user_id,
                     const std::string &action_type,
                     const std::string &outcome,
                     const std::string &ip_address,
                     const std::string &user_agent,
                     Object metadata) {
    if (event_id.empty()) {
        throw ValidationError("restored event has no event_id");
    }
    return Event(event_id, timestamp, user_id, action_type, outcome, ip_address,
                 user_agent, std::move(metadata));
}

Event::Event(std::string event_id,
             Timestamp timestamp,
             const std::string &user_id,
             const std::string &action_type,
             const std::string &outcome,
             const std::string &ip_address,
             const std::string &user_agent,
             Object metadata)
    : event_id_(std::move(event_id)),
      timestamp_(timestamp),
      user_id_(or_default(user_id, kAnonymousUser)),
      action_type_(action_type_from_string(action_type)),
      outcome_(outcome_from_string(outcome)),
      ip_address_(or_default(ip_address, kUnknownProvenance)),
      user_agent_(or_default(user_agent, kUnknownProvenance)),
      metadata_(std::move(metadata)) {
    validate_metadata(metadata_);
}

Object Event::to_dict() const {
    Object out;
    out["event_id"] = event_id_;
    out["timestamp"] = to_iso8601(timestamp_);
    out["user_id"] = user_id_;
    out["action_type"] = action_name();
    out["outcome"] = outcome_name();
    out["ip_address"] = ip_address_;
    out["user_agent"] = user_agent_;
    out["metadata"] = metadata_;
    return out;
}

} // namespace auditstore
