#pragma once

#include "timestamp.hpp"
#include "value.hpp"

#include <string>
#include <vector>

namespace auditstore {

enum class ActionType {
    // Passkey registration
    RegistrationStart,
    RegistrationSuccess,
    RegistrationFailure,
    // Authentication
    AuthenticationStart,
    AuthenticationSuccess,
    AuthenticationFailure,
    // Credential management
    CredentialDeleted,
    CredentialUpdated,
    // AAL2 step-up
    Aal2TimestampSet,
    Aal2AccessGranted,
    Aal2AccessDenied,
    Aal2PolicySet,
    // Role management
    Aal2RoleAssigned,
    Aal2RoleRevoked
};

enum class Outcome {
    Success,
    Failure
};

// Both throw ValidationError for values outside the vocabulary.
ActionType action_type_from_string(const std::string &s);
Outcome outcome_from_string(const std::string &s);

std::string action_type_to_string(ActionType type);
std::string outcome_to_string(Outcome outcome);

bool is_valid_action_type(const std::string &s);
bool is_valid_outcome(const std::string &s);

// The 14 recognized action kinds in canonical order.
const std::vector<std::string> &action_types();

extern const char *const kAnonymousUser;
extern const char *const kUnknownProvenance;

// One security-relevant action. Immutable once constructed.
class Event {
public:
    // Stamps the event with a fresh id and the current UTC time.
    Event(const std::string &user_id,
          const std::string &action_type,
          const std::string &outcome,
          const std::string &ip_address,
          const std::string &user_agent,
          Object metadata = {});

    // Same, but records the instant the action was observed.
    Event(Timestamp timestamp,
          const std::string &user_id,
          const std::string &action_type,
          const std::string &outcome,
          const std::string &ip_address,
          const std::string &user_agent,
          Object metadata = {});

    // Rebuilds a persisted event with its original identity.
    static Event restore(const std::string &event_id,
                         Timestamp timestamp,
                         const std::string &user_id,
                         const std::string &action_type,
                         const std::string &outcome,
                         const std::string &ip_address,
                         const std::string &user_agent,
                         Object metadata);

    const std::string &event_id() const { return event_id_; }
    Timestamp timestamp() const { return timestamp_; }
    const std::string &user_id() const { return user_id_; }
    ActionType action_type() const { return action_type_; }
    Outcome outcome() const { return outcome_; }
    const std::string &ip_address() const { return ip_address_; }
    const std::string &user_agent() const { return user_agent_; }
    const Object &metadata() const { return metadata_; }

    std::string action_name() const { return action_type_to_string(action_type_); }
    std::string outcome_name() const { return outcome_to_string(outcome_); }

    // Plain record with the timestamp rendered as ISO-8601.
    Object to_dict() const;

private:
    Event(std::string event_id,
          Timestamp timestamp,
          const std::string &user_id,
          const std::string &action_type,
          const std::string &outcome,
          const std::string &ip_address,
          const std::string &user_agent,
          Object metadata);

    std::string event_id_;
    Timestamp timestamp_;
    std::string user_id_;
    ActionType action_type_;
    Outcome outcome_;
    std::string ip_address_;
    std::string user_agent_;
    Object metadata_;
};

} // namespace auditstore
