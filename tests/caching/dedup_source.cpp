#include <canopy/caching/dedup_source.hpp>

#include <cppcoro/sync_wait.hpp>
#include <cppcoro/when_all.hpp>
#include <cppcoro/when_all_ready.hpp>

#include <canopy/utilities/errors.h>
#include <canopy/utilities/testing.h>

#include "mock_source.h"

using namespace canopy;

namespace {

child_list
children_of(dedup_source& source, tree_node const& node)
{
    return cppcoro::sync_wait(source.get_children(node));
}

} // namespace

TEST_CASE("dedup source caching", "[caching][dedup_source]")
{
    auto base = std::make_shared<mock_source>();
    manual_clock clock;
    dedup_source source(base, dedup_source_config(), clock.source());
    mock_node node("/proj");

    REQUIRE(
        get_identifiers(children_of(source, node))
        == (std::vector<string>{"/proj/a", "/proj/b"}));
    REQUIRE(children_of(source, node).size() == 2);
    REQUIRE(base->fetch_count("/proj") == 1);

    {
        INFO("Entries expire after the TTL (300 seconds by default).");
        clock.now += 300;
        children_of(source, node);
        REQUIRE(base->fetch_count("/proj") == 1);
        clock.now += 1;
        children_of(source, node);
        REQUIRE(base->fetch_count("/proj") == 2);
    }

    auto stats = source.get_stats();
    REQUIRE(stats.hits == 2);
    REQUIRE(stats.misses == 2);
    REQUIRE(stats.expired_entries == 1);
    REQUIRE(stats.entries == 1);
    REQUIRE(stats.hit_rate == Approx(0.5));

    INFO("clear() drops the entries and resets the statistics.");
    source.clear();
    stats = source.get_stats();
    REQUIRE(stats.entries == 0);
    REQUIRE(stats.hits == 0);
    children_of(source, node);
    REQUIRE(base->fetch_count("/proj") == 3);
}

TEST_CASE("dedup source coalescing", "[caching][dedup_source]")
{
    auto base = std::make_shared<mock_source>();
    dedup_source source(base);
    mock_node node("/proj");

    cppcoro::async_manual_reset_event gate;
    base->set_gate(&gate);
    auto open_gate = [&]() -> cppcoro::task<> {
        gate.set();
        co_return;
    };

    auto [a, b, c, ignored] = cppcoro::sync_wait(cppcoro::when_all(
        source.get_children(node),
        source.get_children(node),
        source.get_children(node),
        open_gate()));
    REQUIRE(a.size() == 2);
    REQUIRE(b.size() == 2);
    REQUIRE(c.size() == 2);
    REQUIRE(base->fetch_count("/proj") == 1);
    REQUIRE(source.get_stats().concurrent_waits == 2);

    INFO("Errors reach every waiter and aren't cached.");
    mock_node failing("/failing");
    base->set_failure(mock_failure::ERROR);
    gate.reset();
    auto [d, e, opened] = cppcoro::sync_wait(cppcoro::when_all_ready(
        source.get_children(failing),
        source.get_children(failing),
        open_gate()));
    REQUIRE_THROWS_AS(d.result(), source_fetch_error);
    REQUIRE_THROWS_AS(e.result(), source_fetch_error);
    REQUIRE(base->fetch_count("/failing") == 1);
    base->set_failure(mock_failure::NONE);
    REQUIRE(children_of(source, failing).size() == 2);
    REQUIRE(base->fetch_count("/failing") == 2);
}

TEST_CASE("dedup source limits", "[caching][dedup_source]")
{
    auto base = std::make_shared<mock_source>();
    dedup_source_config config;
    config.max_entries = 3;
    dedup_source source(base, config);

    for (int i = 0; i != 5; ++i)
        children_of(source, mock_node("/t" + std::to_string(i)));
    auto stats = source.get_stats();
    REQUIRE(stats.entries == 3);
    REQUIRE(stats.evictions == 2);

    config.max_entries = -1;
    REQUIRE_THROWS_AS(dedup_source(base, config), configuration_error);
}

TEST_CASE("dedup source mtime validation", "[caching][dedup_source]")
{
    auto base = std::make_shared<mock_source>();
    manual_clock clock;
    dedup_source_config config;
    config.validate_mtime = true;
    config.ttl_seconds = 10;
    dedup_source source(base, config, clock.source());

    mock_node node("/proj", some(100.0));
    children_of(source, node);
    children_of(source, node);
    REQUIRE(base->fetch_count("/proj") == 1);

    {
        INFO("Entries with an mtime don't expire, but they're checked.");
        clock.now += 1000;
        children_of(source, node);
        REQUIRE(base->fetch_count("/proj") == 1);
        node.set_mtime(some(101.0));
        children_of(source, node);
        REQUIRE(base->fetch_count("/proj") == 2);
        REQUIRE(source.get_stats().expired_entries == 1);
    }

    {
        INFO("Entries without one fall back to the TTL.");
        mock_node timeless("/timeless");
        children_of(source, timeless);
        clock.now += 5;
        children_of(source, timeless);
        REQUIRE(base->fetch_count("/timeless") == 1);
        clock.now += 6;
        children_of(source, timeless);
        REQUIRE(base->fetch_count("/timeless") == 2);
    }
}

TEST_CASE("dedup source identities", "[caching][dedup_source]")
{
    cache_key_allocator allocator;
    auto base = std::make_shared<mock_source>();
    dedup_source a(
        base, dedup_source_config(), system_time_source(), allocator);
    dedup_source b(
        base, dedup_source_config(), system_time_source(), allocator);
    REQUIRE(a.identity() == (cache_identity{"dedup_source", 1}));
    REQUIRE(b.identity() == (cache_identity{"dedup_source", 2}));
}
