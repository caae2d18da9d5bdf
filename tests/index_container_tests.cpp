#include "test_util.hpp"

#include "../store/index_container.hpp"
#include "../store/memory_store.hpp"

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <random>
#include <set>
#include <vector>

using namespace auditstore;
using auditstore::test::FailingStore;
using auditstore::test::base_time;
using auditstore::test::make_event;
using auditstore::test::memory_container;

namespace {

bool contains_id(const std::vector<Event> &events, const std::string &id) {
    return std::any_of(events.begin(), events.end(),
                       [&id](const Event &e) { return e.event_id() == id; });
}

std::vector<std::string> ids_of(const std::vector<Event> &events) {
    std::vector<std::string> out;
    for (const auto &e : events) out.push_back(e.event_id());
    return out;
}

} // namespace

BOOST_AUTO_TEST_SUITE(index_container_tests)

BOOST_AUTO_TEST_CASE(new_container_has_default_metadata)
{
    auto container = memory_container();
    BOOST_CHECK_EQUAL(container->size(), 0u);
    BOOST_CHECK_EQUAL(container->metadata().total_events, 0u);
    BOOST_CHECK_EQUAL(container->metadata().retention_days, 90);
    BOOST_CHECK(!container->metadata().last_cleaned);
    BOOST_CHECK(container->verify_integrity().empty());
}

BOOST_AUTO_TEST_CASE(added_event_reachable_through_all_paths)
{
    auto container = memory_container();
    std::vector<std::string> ids;
    const char *users[] = {"alice", "bob", "carol"};
    for (int i = 0; i < 30; ++i) {
        const Timestamp ts = base_time() + std::chrono::minutes(i);
        const std::string action = action_types()[i % action_types().size()];
        const std::string outcome = i % 4 == 0 ? "failure" : "success";
        ids.push_back(container->add_event(make_event(ts, users[i % 3], action, outcome)));
    }

    BOOST_CHECK_EQUAL(container->size(), 30u);
    BOOST_CHECK_EQUAL(container->metadata().total_events, 30u);

    const auto all = container->query_by_timestamp();
    for (std::size_t i = 0; i < ids.size(); ++i) {
        const Event &event = all[i];
        BOOST_CHECK_EQUAL(event.event_id(), ids[i]);
        BOOST_CHECK(contains_id(container->query_by_user(event.user_id()), ids[i]));
        BOOST_CHECK(contains_id(container->query_by_action(event.action_name()), ids[i]));
        BOOST_CHECK(contains_id(container->query_by_outcome(event.outcome_name()), ids[i]));
    }
    BOOST_CHECK(container->verify_integrity().empty());
}

BOOST_AUTO_TEST_CASE(same_instant_events_are_all_kept_in_order)
{
    auto container = memory_container();
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(container->add_event(make_event(base_time(), "alice")));
    }

    BOOST_CHECK_EQUAL(container->size(), 5u);
    BOOST_CHECK(ids_of(container->query_by_timestamp()) == ids);
    BOOST_CHECK(ids_of(container->query_by_user("alice")) == ids);
    BOOST_CHECK(ids_of(container->query_by_outcome("success")) == ids);
    BOOST_CHECK(container->verify_integrity().empty());
}

BOOST_AUTO_TEST_CASE(key_conversion_is_exact)
{
    const std::int64_t samples[] = {0, 1, 999999, 1736942400000000LL, 1736942400123457LL,
                                    4102444799999999LL};
    for (const std::int64_t scaled : samples) {
        BOOST_CHECK_EQUAL(IndexContainer::to_scaled_key(IndexContainer::to_primary_key(scaled)), scaled);
    }
}

BOOST_AUTO_TEST_CASE(range_queries_use_inclusive_bounds)
{
    auto container = memory_container();
    for (int i = 0; i < 10; ++i) {
        container->add_event(make_event(base_time() + std::chrono::hours(i), i % 2 ? "bob" : "alice"));
    }

    const Timestamp start = base_time() + std::chrono::hours(2);
    const Timestamp end = base_time() + std::chrono::hours(5);
    const auto in_range = container->query_by_timestamp(start, end);
    BOOST_REQUIRE_EQUAL(in_range.size(), 4u);
    BOOST_CHECK(in_range.front().timestamp() == start);
    BOOST_CHECK(in_range.back().timestamp() == end);

    BOOST_CHECK_EQUAL(container->query_by_user("alice", start, end).size(), 2u);
    BOOST_CHECK_EQUAL(container->query_by_timestamp(start, std::nullopt).size(), 8u);
    BOOST_CHECK_EQUAL(container->query_by_timestamp(std::nullopt, start).size(), 3u);
    BOOST_CHECK(container->query_by_timestamp(end, start).empty());
    BOOST_CHECK(container->query_by_user("alice", end, start).empty());
    BOOST_CHECK(container->query_by_user("nobody").empty());
}

BOOST_AUTO_TEST_CASE(cleanup_removes_exactly_older_events)
{
    auto container = memory_container();
    const char *users[] = {"alice", "bob", "carol", "dave"};
    for (int i = 0; i < 40; ++i) {
        container->add_event(make_event(base_time() + std::chrono::hours(i), users[i % 4],
                                        i < 8 ? "credential_updated" : "authentication_success",
                                        i % 3 ? "success" : "failure"));
    }

    const Timestamp cutoff = base_time() + std::chrono::hours(20);
    BOOST_CHECK_EQUAL(container->cleanup_old_events(cutoff), 20u);
    BOOST_CHECK_EQUAL(container->size(), 20u);
    BOOST_CHECK_EQUAL(container->metadata().total_events, 20u);
    BOOST_CHECK(container->metadata().last_cleaned.has_value());

    for (const auto &event : container->query_by_timestamp()) {
        BOOST_CHECK(event.timestamp() >= cutoff);
    }
    // Every credential_updated event was older than the cutoff.
    BOOST_CHECK(container->query_by_action("credential_updated").empty());
    BOOST_CHECK_EQUAL(container->get_stats().action_types_count, 1u);
    BOOST_CHECK(container->verify_integrity().empty());

    BOOST_CHECK_EQUAL(container->cleanup_old_events(cutoff), 0u);
    BOOST_CHECK_EQUAL(container->size(), 20u);
}

BOOST_AUTO_TEST_CASE(cleanup_drops_empty_buckets)
{
    auto container = memory_container();
    for (int i = 0; i < 50; ++i) {
        container->add_event(make_event(base_time() + std::chrono::seconds(i), "user" + std::to_string(i)));
    }
    BOOST_CHECK_EQUAL(container->get_stats().users_count, 50u);

    container->cleanup_old_events(base_time() + std::chrono::seconds(45));
    BOOST_CHECK_EQUAL(container->get_stats().users_count, 5u);
    BOOST_CHECK(container->verify_integrity().empty());
}

BOOST_AUTO_TEST_CASE(random_workload_keeps_invariants)
{
    auto container = memory_container();
    std::mt19937 gen(1234);
    std::uniform_int_distribution<int> offset(0, 3600);
    std::uniform_int_distribution<int> user(0, 9);
    std::uniform_int_distribution<std::size_t> action(0, action_types().size() - 1);
    std::uniform_int_distribution<int> coin(0, 1);

    for (int round = 0; round < 5; ++round) {
        for (int i = 0; i < 100; ++i) {
            const Timestamp ts = base_time() + std::chrono::seconds(round * 3600 + offset(gen));
            container->add_event(make_event(ts, "u" + std::to_string(user(gen)),
                                            action_types()[action(gen)],
                                            coin(gen) ? "success" : "failure"));
        }
        container->cleanup_old_events(base_time() + std::chrono::seconds(round * 2000));
        BOOST_CHECK_EQUAL(container->metadata().total_events, container->size());
        const auto problems = container->verify_integrity();
        BOOST_CHECK_MESSAGE(problems.empty(), (problems.empty() ? "" : problems.front()));
    }
    BOOST_CHECK_EQUAL(container->outcome_count("success") + container->outcome_count("failure"),
                      container->size());
}

BOOST_AUTO_TEST_CASE(stats_report_bucket_counts)
{
    auto container = memory_container();
    container->add_event(make_event(base_time(), "alice", "registration_start"));
    container->add_event(make_event(base_time(), "bob", "registration_start"));
    container->add_event(make_event(base_time(), "alice", "registration_success"));

    const ContainerStats stats = container->get_stats();
    BOOST_CHECK_EQUAL(stats.total_events, 3u);
    BOOST_CHECK_EQUAL(stats.users_count, 2u);
    BOOST_CHECK_EQUAL(stats.action_types_count, 2u);
    BOOST_CHECK_EQUAL(stats.retention_days, 90);
    BOOST_CHECK_EQUAL(stats.index_violations, 0u);

    const Object dict = stats.to_dict();
    BOOST_CHECK(dict.at("last_cleaned").is_null());
    BOOST_CHECK_EQUAL(dict.at("total_events").as_integer(), 3);
}

BOOST_AUTO_TEST_CASE(retention_days_must_be_positive)
{
    auto container = memory_container();
    container->set_retention_days(30);
    BOOST_CHECK_EQUAL(container->metadata().retention_days, 30);
    BOOST_CHECK_THROW(container->set_retention_days(0), ValidationError);
    BOOST_CHECK_EQUAL(container->metadata().retention_days, 30);
}

BOOST_AUTO_TEST_CASE(every_mutation_commits_once)
{
    auto store = std::make_unique<MemoryHostStore>();
    MemoryHostStore &raw = *store;
    IndexContainer container(std::move(store));
    const std::size_t initial = raw.commits();

    container.add_event(make_event(base_time()));
    container.add_event(make_event(base_time()));
    container.cleanup_old_events(base_time() + std::chrono::seconds(1));
    BOOST_CHECK_EQUAL(raw.commits(), initial + 3);
    BOOST_CHECK_EQUAL(raw.rollbacks(), 0u);
}

BOOST_AUTO_TEST_CASE(failed_add_leaves_container_unchanged)
{
    auto store = std::make_unique<FailingStore>();
    FailingStore &raw = *store;
    IndexContainer container(std::move(store));
    const std::string kept = container.add_event(make_event(base_time(), "alice"));

    raw.fail_metadata = true;
    BOOST_CHECK_THROW(container.add_event(make_event(base_time(), "bob", "aal2_role_assigned", "failure")),
                      StorageError);

    BOOST_CHECK_EQUAL(raw.rollbacks(), 1u);
    BOOST_CHECK_EQUAL(container.size(), 1u);
    BOOST_CHECK_EQUAL(container.metadata().total_events, 1u);
    BOOST_CHECK(container.query_by_user("bob").empty());
    BOOST_CHECK(container.query_by_action("aal2_role_assigned").empty());
    BOOST_CHECK_EQUAL(container.outcome_count("failure"), 0u);
    BOOST_CHECK_EQUAL(container.get_stats().users_count, 1u);
    BOOST_CHECK(container.verify_integrity().empty());

    raw.fail_metadata = false;
    container.add_event(make_event(base_time(), "bob"));
    const auto all = container.query_by_timestamp();
    BOOST_REQUIRE_EQUAL(all.size(), 2u);
    BOOST_CHECK_EQUAL(all.front().event_id(), kept);
}

BOOST_AUTO_TEST_CASE(failed_cleanup_leaves_container_unchanged)
{
    auto store = std::make_unique<FailingStore>();
    FailingStore &raw = *store;
    IndexContainer container(std::move(store));
    for (int i = 0; i < 10; ++i) {
        container.add_event(make_event(base_time() + std::chrono::hours(i), "user" + std::to_string(i)));
    }

    raw.fail_erase = true;
    BOOST_CHECK_THROW(container.cleanup_old_events(base_time() + std::chrono::hours(5)), StorageError);

    BOOST_CHECK_EQUAL(container.size(), 10u);
    BOOST_CHECK_EQUAL(container.metadata().total_events, 10u);
    BOOST_CHECK(!container.metadata().last_cleaned);
    BOOST_CHECK_EQUAL(container.get_stats().users_count, 10u);
    BOOST_CHECK_EQUAL(container.query_by_user("user0").size(), 1u);
    BOOST_CHECK(container.verify_integrity().empty());
}

BOOST_AUTO_TEST_SUITE_END()
