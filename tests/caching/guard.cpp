#include <canopy/caching/guard.hpp>

#include <limits>

#include <canopy/utilities/testing.h>

using namespace canopy;

TEST_CASE("cache admission", "[caching][guard]")
{
    cache_limits limits;
    limits.max_entries = 10;
    limits.max_memory_bytes = 1000;
    limits.max_cache_depth = 5;
    limits.max_path_depth = 3;
    resource_guard guard(limits);

    REQUIRE(guard.admit("/a/b", 5, 100) == cache_admission::ACCEPTED);
    REQUIRE(
        guard.admit("/a/b", complete_depth, 100) == cache_admission::ACCEPTED);
    REQUIRE(
        guard.admit("/a/b", 6, 100) == cache_admission::DEPTH_TOO_LARGE);
    REQUIRE(
        guard.admit("/a/b/c", 1, 100) == cache_admission::PATH_TOO_DEEP);
    REQUIRE(guard.admit("a/b/c", 1, 100) == cache_admission::ACCEPTED);
    REQUIRE(
        guard.admit("/a", 1, 1001) == cache_admission::ENTRY_TOO_LARGE);

    limits.max_entries = 0;
    REQUIRE(
        resource_guard(limits).admit("/a", 1, 100)
        == cache_admission::CACHING_DISABLED);

    INFO("A disabled guard accepts everything.");
    limits.enabled = false;
    REQUIRE(
        resource_guard(limits).admit("/a/b/c/d/e", 99, 1000000)
        == cache_admission::ACCEPTED);
}

TEST_CASE("limit enforcement", "[caching][guard]")
{
    cache_limits limits;
    limits.max_entries = 2;
    cache_store store;
    for (int i = 0; i != 4; ++i)
    {
        cache_entry entry;
        entry.depth = 1;
        entry.size_estimate = 10;
        store.insert(
            make_cache_key(
                cache_identity{"completeness_cache", 1},
                cache_key_kind::COMPLETENESS,
                "/t" + std::to_string(i),
                1),
            entry);
    }

    limits.enabled = false;
    REQUIRE(resource_guard(limits).enforce(store) == 0);
    REQUIRE(store.size() == 4);

    limits.enabled = true;
    REQUIRE(resource_guard(limits).enforce(store) == 2);
    REQUIRE(store.size() == 2);
}

TEST_CASE("limits from config", "[caching][guard]")
{
    completeness_cache_config config;
    config.max_memory_mb = 2.0;
    config.max_entries = 7;
    auto limits = make_cache_limits(resolve_cache_config(config));
    REQUIRE(limits.enabled);
    REQUIRE(limits.max_entries == 7);
    REQUIRE(limits.max_memory_bytes == 2 * 1048576);
    REQUIRE(limits.max_cache_depth == 50);
    REQUIRE(limits.max_path_depth == 30);
}

TEST_CASE("huge memory limits", "[caching][guard]")
{
    completeness_cache_config config;
    config.max_memory_mb = 1e300;
    auto limits = make_cache_limits(resolve_cache_config(config));
    REQUIRE(limits.max_memory_bytes == std::numeric_limits<size_t>::max());
    REQUIRE(
        resource_guard(limits).admit("/a", 1, size_t(1) << 40)
        == cache_admission::ACCEPTED);
}
