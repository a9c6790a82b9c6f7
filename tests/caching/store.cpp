#include <canopy/caching/store.hpp>

#include <canopy/utilities/testing.h>

#include "mock_source.h"

using namespace canopy;

namespace {

cache_identity const the_identity{"completeness_cache", 1};

cache_key
key_for(string const& target, integer depth)
{
    return make_cache_key(
        the_identity, cache_key_kind::COMPLETENESS, target, depth);
}

cache_entry
make_entry(integer depth, size_t size = 100)
{
    cache_entry entry;
    entry.data = child_list{std::make_shared<mock_node>("child")};
    entry.depth = depth;
    entry.size_estimate = size;
    return entry;
}

// Insert an entry and return its serial number.
uint64_t
insert_entry(
    cache_store& store, string const& target, integer depth, size_t size = 100)
{
    store.insert(key_for(target, depth), make_entry(depth, size));
    return store.find(key_for(target, depth))->serial;
}

} // namespace

TEST_CASE("store completeness matching", "[caching][store]")
{
    cache_store store;
    insert_entry(store, "/proj", 10);

    {
        INFO("An entry satisfies requests at its own depth.");
        auto match = store.find_satisfying(key_for("/proj", 10));
        REQUIRE(match);
        REQUIRE(match->key.depth == 10);
    }

    {
        INFO("An entry satisfies shallower requests.");
        auto match = store.find_satisfying(key_for("/proj", 5));
        REQUIRE(match);
        REQUIRE(match->key.depth == 10);
        REQUIRE(match->entry->depth == 10);
    }

    {
        INFO("An entry doesn't satisfy deeper or complete requests.");
        REQUIRE(!store.find_satisfying(key_for("/proj", 15)));
        REQUIRE(!store.find_satisfying(key_for("/proj", complete_depth)));
    }

    {
        INFO("Other targets aren't affected.");
        REQUIRE(!store.find_satisfying(key_for("/other", 0)));
        REQUIRE(!store.find_satisfying(key_for("/proj/sub", 0)));
    }

    {
        INFO("A complete entry satisfies everything.");
        insert_entry(store, "/done", complete_depth);
        REQUIRE(store.find_satisfying(key_for("/done", 0)));
        REQUIRE(store.find_satisfying(key_for("/done", 100)));
        auto match = store.find_satisfying(key_for("/done", complete_depth));
        REQUIRE(match);
        REQUIRE(match->entry->is_complete());
    }
}

TEST_CASE("store upgrades", "[caching][store]")
{
    cache_store store;
    insert_entry(store, "/proj", 3);
    insert_entry(store, "/proj/sub", 1);
    REQUIRE(store.size() == 2);
    REQUIRE(store.memory_usage() == 200);

    {
        INFO("Inserting a deeper entry supersedes the shallower one.");
        REQUIRE(store.insert(key_for("/proj", 7), make_entry(7)) == 1);
        REQUIRE(store.counters().upgrades == 1);
        REQUIRE(store.size() == 2);
        REQUIRE(!store.find(key_for("/proj", 3)));
        REQUIRE(store.cached_depths(key_for("/proj", 0))
                == std::set<integer>{7});
    }

    {
        INFO("Inserting a shallower entry supersedes nothing.");
        REQUIRE(store.insert(key_for("/proj", 2), make_entry(2)) == 0);
        REQUIRE(store.counters().upgrades == 1);
        REQUIRE(store.size() == 3);
        INFO("The deepest entry still answers requests it satisfies.");
        auto match = store.find_satisfying(key_for("/proj", 5));
        REQUIRE(match);
        REQUIRE(match->key.depth == 7);
    }

    {
        INFO("A complete entry supersedes every partial one.");
        REQUIRE(
            store.insert(key_for("/proj", complete_depth), make_entry(-1))
            == 2);
        REQUIRE(store.counters().upgrades == 2);
        REQUIRE(store.cached_depths(key_for("/proj", 0))
                == std::set<integer>{complete_depth});
    }

    {
        INFO("Replacing an entry with the same key isn't an upgrade.");
        REQUIRE(
            store.insert(key_for("/proj", complete_depth), make_entry(-1, 50))
            == 0);
        REQUIRE(store.counters().upgrades == 2);
        REQUIRE(store.size() == 2);
    }

    INFO("Memory accounting follows all of the above.");
    REQUIRE(store.memory_usage() == 150);
}

TEST_CASE("store serial numbers", "[caching][store]")
{
    cache_store store;
    auto first = insert_entry(store, "/proj", 1);
    REQUIRE(store.use(key_for("/proj", 1), first));
    REQUIRE(store.find(key_for("/proj", 1))->access_count == 1);

    auto second = insert_entry(store, "/proj", 1);
    REQUIRE(second != first);
    REQUIRE(!store.use(key_for("/proj", 1), first));
    REQUIRE(!store.lookup(key_for("/proj", 1), first));
    REQUIRE(store.lookup(key_for("/proj", 1), second));
    INFO("lookup() doesn't count as a use.");
    REQUIRE(store.find(key_for("/proj", 1))->access_count == 0);
}

TEST_CASE("store LRU eviction", "[caching][store]")
{
    cache_store store;
    for (int i = 0; i != 5; ++i)
        insert_entry(store, "/t" + std::to_string(i), 1);

    // Touch /t0 so that /t1 becomes the least recently used entry.
    store.use(key_for("/t0", 1), store.find(key_for("/t0", 1))->serial);

    REQUIRE(store.evict_until_within(3, 1000000) == 2);
    REQUIRE(store.size() == 3);
    REQUIRE(store.counters().evictions == 2);
    REQUIRE(store.find(key_for("/t0", 1)));
    REQUIRE(!store.find(key_for("/t1", 1)));
    REQUIRE(!store.find(key_for("/t2", 1)));
    REQUIRE(store.find(key_for("/t3", 1)));
    REQUIRE(store.find(key_for("/t4", 1)));

    INFO("Memory limits are enforced too.");
    REQUIRE(store.evict_until_within(10, 150) == 2);
    REQUIRE(store.size() == 1);
    REQUIRE(store.memory_usage() == 100);
    REQUIRE(store.find(key_for("/t0", 1)));
}

TEST_CASE("unordered store eviction", "[caching][store]")
{
    cache_store store(false);
    REQUIRE(!store.is_lru_ordered());
    for (int i = 0; i != 5; ++i)
        insert_entry(store, "/t" + std::to_string(i), 1);
    store.use(key_for("/t0", 1), store.find(key_for("/t0", 1))->serial);
    REQUIRE(store.evict_until_within(2, 1000000) == 3);
    REQUIRE(store.size() == 2);
    REQUIRE(store.memory_usage() == 200);
}

TEST_CASE("store invalidation", "[caching][store]")
{
    cache_store store;
    insert_entry(store, "/proj", complete_depth);
    insert_entry(store, "/proj/a", 1);
    insert_entry(store, "/proj/a", 2);
    insert_entry(store, "/proj/a/x", 0);
    insert_entry(store, "/proj/b", 1);
    insert_entry(store, "/project", 1);
    insert_entry(store, "/other", 1);
    // Inserting /proj/a at depth 2 superseded depth 1.
    REQUIRE(store.size() == 6);

    {
        INFO("Shallow invalidation removes the target at every depth.");
        insert_entry(store, "/other", 0);
        REQUIRE(store.invalidate_target(key_for("/other", 0)) == 2);
        REQUIRE(store.counters().invalidations == 2);
        REQUIRE(store.size() == 5);
    }

    {
        INFO("Deep invalidation removes descendants but not siblings that "
             "merely share a prefix.");
        REQUIRE(store.invalidate_subtree(key_for("/proj/a", 0)) == 2);
        REQUIRE(store.find(key_for("/proj", complete_depth)));
        REQUIRE(store.find(key_for("/proj/b", 1)));
        REQUIRE(store.invalidate_subtree(key_for("/proj", 0)) == 2);
        REQUIRE(store.find(key_for("/project", 1)));
        REQUIRE(store.size() == 1);
    }

    {
        INFO("Invalidating everything reports the prior entry count.");
        REQUIRE(store.invalidate_all() == 1);
        REQUIRE(store.size() == 0);
        REQUIRE(store.memory_usage() == 0);
        REQUIRE(store.counters().invalidations == 7);
    }
}

TEST_CASE("stores are scoped by cache identity", "[caching][store]")
{
    cache_store store;
    auto mine = make_cache_key(
        the_identity, cache_key_kind::COMPLETENESS, "/proj", 1);
    auto theirs = make_cache_key(
        cache_identity{"completeness_cache", 2},
        cache_key_kind::COMPLETENESS,
        "/proj",
        1);
    store.insert(mine, make_entry(1));
    store.insert(theirs, make_entry(1));
    REQUIRE(store.size() == 2);
    REQUIRE(store.invalidate_subtree(mine) == 1);
    REQUIRE(store.find(theirs));
}
