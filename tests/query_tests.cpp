#include "test_util.hpp"

#include "../query/query.hpp"

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <map>
#include <random>
#include <set>
#include <vector>

using namespace auditstore;
using auditstore::test::base_time;
using auditstore::test::make_event;
using auditstore::test::memory_container;

namespace {

struct PopulatedContainer {
    PopulatedContainer() : container(memory_container()) {
        std::mt19937 gen(42);
        std::uniform_int_distribution<int> user(0, 4);
        std::uniform_int_distribution<std::size_t> action(0, action_types().size() - 1);
        std::uniform_int_distribution<int> coin(0, 2);
        std::uniform_int_distribution<int> seconds(0, 86400 * 3);
        for (int i = 0; i < 200; ++i) {
            container->add_event(make_event(base_time() + std::chrono::seconds(seconds(gen)),
                                            "user" + std::to_string(user(gen)),
                                            action_types()[action(gen)],
                                            coin(gen) == 0 ? "failure" : "success"));
        }
    }

    std::unique_ptr<IndexContainer> container;
};

std::set<std::string> ids_of(const std::vector<Event> &events) {
    std::set<std::string> out;
    for (const auto &e : events) out.insert(e.event_id());
    return out;
}

std::set<std::string> ids_of(const std::vector<Object> &records) {
    std::set<std::string> out;
    for (const auto &r : records) out.insert(r.at("event_id").as_string());
    return out;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(query_tests, PopulatedContainer)

BOOST_AUTO_TEST_CASE(user_and_outcome_is_an_intersection)
{
    for (int u = 0; u < 5; ++u) {
        const std::string user = "user" + std::to_string(u);
        QueryFilters filters;
        filters.user_id = user;
        filters.outcome = "failure";

        std::vector<Event> expected;
        for (const auto &event : container->query_by_user(user)) {
            if (event.outcome_name() == "failure") expected.push_back(event);
        }

        const QueryResult result = query_audit_logs(*container, filters);
        BOOST_CHECK(!result.error);
        BOOST_CHECK_EQUAL(result.total, expected.size());
        BOOST_CHECK(ids_of(result.events) == ids_of(expected));
    }
}

BOOST_AUTO_TEST_CASE(results_are_most_recent_first)
{
    const QueryResult result = query_audit_logs(*container);
    BOOST_REQUIRE_EQUAL(result.events.size(), 200u);
    for (std::size_t i = 1; i < result.events.size(); ++i) {
        BOOST_CHECK(result.events[i - 1].at("timestamp").as_string() >=
                    result.events[i].at("timestamp").as_string());
    }
    BOOST_CHECK(!result.limit);
    BOOST_CHECK(!result.has_more);
}

BOOST_AUTO_TEST_CASE(all_filters_combine)
{
    QueryFilters filters;
    filters.action_type = "authentication_failure";
    filters.outcome = "success";
    // Half-second bounds keep same-second key bumps off the boundary.
    filters.start_time = base_time() + std::chrono::hours(12) + std::chrono::milliseconds(500);
    filters.end_time = base_time() + std::chrono::hours(48) + std::chrono::milliseconds(500);

    std::size_t expected = 0;
    for (const auto &event : container->query_by_timestamp()) {
        if (event.action_name() == *filters.action_type && event.outcome_name() == *filters.outcome &&
            event.timestamp() >= *filters.start_time && event.timestamp() <= *filters.end_time) {
            ++expected;
        }
    }
    BOOST_CHECK_EQUAL(select_events(*container, filters).size(), expected);
}

BOOST_AUTO_TEST_CASE(pages_reconstruct_the_full_set)
{
    QueryFilters filters;
    filters.outcome = "success";
    const std::vector<Event> full = select_events(*container, filters);

    const std::size_t page_size = 17;
    std::vector<std::string> collected;
    for (std::size_t offset = 0;; offset += page_size) {
        const QueryResult page = query_audit_logs(*container, filters, page_size, offset);
        BOOST_CHECK_EQUAL(page.total, full.size());
        BOOST_CHECK_EQUAL(page.offset, offset);
        for (const auto &record : page.events) {
            collected.push_back(record.at("event_id").as_string());
        }
        BOOST_CHECK_EQUAL(page.has_more, offset + page.events.size() < full.size());
        if (!page.has_more) break;
    }

    BOOST_REQUIRE_EQUAL(collected.size(), full.size());
    for (std::size_t i = 0; i < full.size(); ++i) {
        BOOST_CHECK_EQUAL(collected[i], full[i].event_id());
    }
}

BOOST_AUTO_TEST_CASE(offset_past_end_gives_empty_page)
{
    const QueryResult result = query_audit_logs(*container, QueryFilters(), 10, 500);
    BOOST_CHECK(result.events.empty());
    BOOST_CHECK_EQUAL(result.total, 200u);
    BOOST_CHECK(!result.has_more);

    const Object dict = result.to_dict();
    BOOST_CHECK_EQUAL(dict.at("limit").as_integer(), 10);
    BOOST_CHECK_EQUAL(dict.at("offset").as_integer(), 500);
    BOOST_CHECK(dict.at("events").as_array().empty());
    BOOST_CHECK(dict.find("error") == dict.end());
}

BOOST_AUTO_TEST_CASE(unknown_dimension_value_matches_nothing)
{
    QueryFilters filters;
    filters.user_id = "nobody";
    const QueryResult result = query_audit_logs(*container, filters, 5);
    BOOST_CHECK_EQUAL(result.total, 0u);
    BOOST_CHECK(result.events.empty());
    BOOST_CHECK_EQUAL(result.to_json(),
                      "{\"events\": [], \"has_more\": false, \"limit\": 5, \"offset\": 0, \"total\": 0}");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(query_param_tests)

BOOST_AUTO_TEST_CASE(parse_filters_reads_dates_and_dimensions)
{
    const std::map<std::string, std::string> params = {
        {"user_id", "alice"},
        {"action_type", "authentication_failure"},
        {"outcome", "failure"},
        {"start_date", "2025-01-15T12:00:00Z"},
        {"end_date", "2025-01-16T14:00:00+02:00"},
    };
    const QueryFilters filters = parse_filters(params, base_time());
    BOOST_CHECK_EQUAL(*filters.user_id, "alice");
    BOOST_CHECK_EQUAL(*filters.action_type, "authentication_failure");
    BOOST_CHECK_EQUAL(*filters.outcome, "failure");
    BOOST_REQUIRE(filters.start_time && filters.end_time);
    BOOST_CHECK(*filters.start_time == base_time());
    BOOST_CHECK(*filters.end_time == base_time() + std::chrono::hours(24));
}

BOOST_AUTO_TEST_CASE(parse_filters_ignores_invalid_values)
{
    const std::map<std::string, std::string> params = {
        {"user_id", ""},
        {"outcome", "partial"},
        {"start_date", "not-a-date"},
        {"days", "seven"},
    };
    const QueryFilters filters = parse_filters(params, base_time());
    BOOST_CHECK(!filters.user_id);
    BOOST_CHECK(!filters.outcome);
    BOOST_CHECK(!filters.start_time);
    BOOST_CHECK(!filters.end_time);
}

BOOST_AUTO_TEST_CASE(days_sets_start_unless_start_date_given)
{
    QueryFilters filters = parse_filters({{"days", "7"}}, base_time());
    BOOST_REQUIRE(filters.start_time);
    BOOST_CHECK(*filters.start_time == base_time() - std::chrono::hours(24 * 7));

    filters = parse_filters({{"days", "7"}, {"start_date", "2025-01-01"}}, base_time());
    BOOST_REQUIRE(filters.start_time);
    BOOST_CHECK(*filters.start_time == parse_iso8601("2025-01-01T00:00:00Z"));

    const char *out_of_range[] = {"1000000000", "9223372036854775807", "-9223372036854775808", "-3000000"};
    for (const char *days : out_of_range) {
        filters = parse_filters({{"days", days}}, base_time());
        BOOST_CHECK(!filters.start_time);
    }

    filters = parse_filters({{"days", "-1"}}, base_time());
    BOOST_REQUIRE(filters.start_time);
    BOOST_CHECK(*filters.start_time == base_time() + std::chrono::hours(24));
}

BOOST_AUTO_TEST_CASE(parse_limit_clamps)
{
    BOOST_CHECK_EQUAL(parse_limit("", 100, 1000), 100u);
    BOOST_CHECK_EQUAL(parse_limit("25", 100, 1000), 25u);
    BOOST_CHECK_EQUAL(parse_limit("5000", 100, 1000), 1000u);
    BOOST_CHECK_EQUAL(parse_limit("-3", 100, 1000), 0u);
    BOOST_CHECK_EQUAL(parse_limit("lots", 100, 1000), 100u);
    BOOST_CHECK_EQUAL(parse_limit("12abc", 100, 1000), 100u);
}

BOOST_AUTO_TEST_SUITE_END()
