#include "test_util.hpp"

#include "../audit/event.hpp"
#include "../audit/timestamp.hpp"
#include "../audit/value.hpp"

#include <boost/test/unit_test.hpp>

#include <set>

using namespace auditstore;
using auditstore::test::base_time;
using auditstore::test::make_event;

BOOST_AUTO_TEST_SUITE(event_tests)

BOOST_AUTO_TEST_CASE(vocabulary_has_fourteen_action_types)
{
    BOOST_CHECK_EQUAL(action_types().size(), 14u);
    for (const auto &name : action_types()) {
        BOOST_CHECK(is_valid_action_type(name));
        BOOST_CHECK_EQUAL(action_type_to_string(action_type_from_string(name)), name);
    }
    BOOST_CHECK(!is_valid_action_type("login"));
    BOOST_CHECK(is_valid_outcome("success"));
    BOOST_CHECK(is_valid_outcome("failure"));
    BOOST_CHECK(!is_valid_outcome("SUCCESS"));
}

BOOST_AUTO_TEST_CASE(construction_rejects_unknown_vocabulary)
{
    BOOST_CHECK_THROW(Event("alice", "login", "success", "ip", "ua"), ValidationError);
    BOOST_CHECK_THROW(Event("alice", "authentication_success", "maybe", "ip", "ua"), ValidationError);
    BOOST_CHECK_THROW(Event("alice", "", "success", "ip", "ua"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(missing_actor_and_provenance_get_defaults)
{
    const Event event("", "registration_start", "success", "", "");
    BOOST_CHECK_EQUAL(event.user_id(), "anonymous");
    BOOST_CHECK_EQUAL(event.ip_address(), "unknown");
    BOOST_CHECK_EQUAL(event.user_agent(), "unknown");
    BOOST_CHECK(event.metadata().empty());
}

BOOST_AUTO_TEST_CASE(event_ids_are_unique_uuid4)
{
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        const Event event = make_event(base_time());
        const std::string &id = event.event_id();
        BOOST_REQUIRE_EQUAL(id.size(), 36u);
        BOOST_CHECK_EQUAL(id[8], '-');
        BOOST_CHECK_EQUAL(id[14], '4');
        BOOST_CHECK(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
        ids.insert(id);
    }
    BOOST_CHECK_EQUAL(ids.size(), 200u);
}

BOOST_AUTO_TEST_CASE(metadata_rejects_arrays)
{
    Object nested;
    nested["list"] = Array{Value(1), Value(2)};
    Object metadata;
    metadata["detail"] = nested;
    BOOST_CHECK_THROW(make_event(base_time(), "alice", "aal2_policy_set", "success", metadata),
                      ValidationError);
}

BOOST_AUTO_TEST_CASE(to_dict_renders_all_fields)
{
    Object metadata;
    metadata["credential_id"] = "cred-1";
    metadata["attempt"] = 3;
    const Event event = make_event(base_time() + std::chrono::microseconds(42), "bob",
                                   "credential_deleted", "failure", metadata);

    const Object dict = event.to_dict();
    BOOST_CHECK_EQUAL(dict.size(), 8u);
    BOOST_CHECK_EQUAL(dict.at("event_id").as_string(), event.event_id());
    BOOST_CHECK_EQUAL(dict.at("timestamp").as_string(), "2025-01-15T12:00:00.000042+00:00");
    BOOST_CHECK_EQUAL(dict.at("user_id").as_string(), "bob");
    BOOST_CHECK_EQUAL(dict.at("action_type").as_string(), "credential_deleted");
    BOOST_CHECK_EQUAL(dict.at("outcome").as_string(), "failure");
    BOOST_CHECK_EQUAL(dict.at("ip_address").as_string(), "192.0.2.10");
    BOOST_CHECK_EQUAL(dict.at("user_agent").as_string(), "test-agent");
    BOOST_CHECK(dict.at("metadata") == Value(metadata));
}

BOOST_AUTO_TEST_CASE(timestamp_round_trips_at_microsecond_precision)
{
    const Timestamp samples[] = {
        base_time(),
        base_time() + std::chrono::microseconds(1),
        base_time() + std::chrono::microseconds(999999),
        from_epoch_micros(0),
        from_epoch_micros(-1),
        now_utc(),
    };
    for (const Timestamp ts : samples) {
        const Event event = make_event(ts);
        const Timestamp parsed = parse_iso8601(event.to_dict().at("timestamp").as_string());
        BOOST_CHECK_EQUAL(to_epoch_micros(parsed), to_epoch_micros(ts));
    }
}

BOOST_AUTO_TEST_CASE(parse_accepts_offsets_and_dates)
{
    BOOST_CHECK_EQUAL(to_epoch_micros(parse_iso8601("2025-01-15T12:00:00Z")),
                      to_epoch_micros(base_time()));
    BOOST_CHECK_EQUAL(to_epoch_micros(parse_iso8601("2025-01-15T14:00:00+02:00")),
                      to_epoch_micros(base_time()));
    BOOST_CHECK_EQUAL(to_epoch_micros(parse_iso8601("2025-01-15T07:00:00-0500")),
                      to_epoch_micros(base_time()));
    BOOST_CHECK_EQUAL(to_epoch_micros(parse_iso8601("2025-01-15 12:00")),
                      to_epoch_micros(base_time()));
    BOOST_CHECK_EQUAL(to_epoch_micros(parse_iso8601("2025-01-15")),
                      to_epoch_micros(base_time() - std::chrono::hours(12)));
    BOOST_CHECK_EQUAL(to_epoch_micros(parse_iso8601("2025-01-15T12:00:00.5Z")),
                      to_epoch_micros(base_time() + std::chrono::milliseconds(500)));
}

BOOST_AUTO_TEST_CASE(parse_rejects_garbage)
{
    BOOST_CHECK_THROW(parse_iso8601(""), ValidationError);
    BOOST_CHECK_THROW(parse_iso8601("yesterday"), ValidationError);
    BOOST_CHECK_THROW(parse_iso8601("2025-13-01"), ValidationError);
    BOOST_CHECK_THROW(parse_iso8601("2025-01-15T25:00"), ValidationError);
    BOOST_CHECK_THROW(parse_iso8601("2025-01-15T12:00:00Zjunk"), ValidationError);
}

BOOST_AUTO_TEST_CASE(compact_stamp_format)
{
    BOOST_CHECK_EQUAL(to_compact_stamp(base_time() + std::chrono::seconds(61)), "20250115_120101");
}

BOOST_AUTO_TEST_CASE(value_json_writer)
{
    Object inner;
    inner["b"] = true;
    inner["n"] = Value();
    Object obj;
    obj["a"] = 1;
    obj["f"] = 2.0;
    obj["s"] = "q\"\n";
    obj["o"] = inner;
    obj["l"] = Array{Value(1), Value("x")};

    BOOST_CHECK_EQUAL(to_json(obj),
                      "{\"a\": 1, \"f\": 2.0, \"l\": [1, \"x\"], \"o\": {\"b\": true, \"n\": null}, "
                      "\"s\": \"q\\\"\\n\"}");
    BOOST_CHECK_EQUAL(to_json(Object()), "{}");
    BOOST_CHECK_EQUAL(to_json(inner, 2), "{\n  \"b\": true,\n  \"n\": null\n}");
}

BOOST_AUTO_TEST_SUITE_END()
