#ifndef CANOPY_CACHING_STORE_HPP
#define CANOPY_CACHING_STORE_HPP

#include <list>
#include <map>
#include <set>
#include <unordered_map>

#include <canopy/caching/entry.hpp>
#include <canopy/caching/keys.hpp>

// The cache store is the in-memory map from cache keys to cache entries.
//
// It's responsible for
//
// - completeness matching (finding an entry that satisfies a requested depth,
//   even if it was cached at a different depth),
//
// - upgrades (dropping shallower entries for a target when a more complete
//   one is inserted),
//
// - memory accounting (the store's memory usage is always the sum of the
//   size estimates of its entries), and
//
// - LRU eviction.
//
// A store can be LRU-ordered (the default) or unordered. Unordered stores skip
// the bookkeeping needed to track access order. They can still evict (in
// arbitrary order), but they're intended for configurations where eviction
// never happens.
//
// The store is NOT internally synchronized. Its owner is expected to protect
// it with a mutex.

namespace canopy {

namespace detail {

struct cache_store_record
{
    cache_entry entry;

    // This record's position in the LRU list. (Only valid if the store is
    // LRU-ordered.)
    std::list<cache_key const*>::iterator lru_position;
};

} // namespace detail

struct cache_store_counters
{
    // entries removed to stay within limits
    integer evictions = 0;
    // entries removed by explicit invalidation
    integer invalidations = 0;
    // insertions that superseded less complete entries for the same target
    integer upgrades = 0;
};

// the result of a successful completeness match
struct cache_store_match
{
    cache_key key;
    // Only valid until the store is next modified.
    cache_entry const* entry;
};

struct cache_store : noncopyable
{
    explicit cache_store(bool lru_ordered = true);

    bool
    is_lru_ordered() const
    {
        return lru_ordered_;
    }

    // the number of entries in the store
    size_t
    size() const
    {
        return records_.size();
    }

    // the sum of the size estimates of all entries in the store
    size_t
    memory_usage() const
    {
        return memory_usage_;
    }

    cache_store_counters const&
    counters() const
    {
        return counters_;
    }

    // Get the entry for exactly :key, or nullptr if there isn't one.
    // This doesn't count as a use of the entry.
    cache_entry const*
    find(cache_key const& key) const;

    // Find an entry that satisfies a request for :request.target at
    // :request.depth.
    //
    // This tries the exact key first, then the complete entry for the target,
    // then the deepest other entry for the target (if it's deep enough).
    //
    optional<cache_store_match>
    find_satisfying(cache_key const& request) const;

    // Record a use of the entry for :key, provided it's still the entry with
    // the given serial number. This moves it to the most recently used
    // position and bumps its access count.
    //
    // The return value is nullptr if the entry is gone (or was replaced).
    //
    cache_entry*
    use(cache_key const& key, uint64_t serial);

    // Get mutable access to the entry for :key if it still has the given
    // serial number. This doesn't count as a use of the entry.
    cache_entry*
    lookup(cache_key const& key, uint64_t serial);

    // Insert :entry under :key.
    //
    // Any entry with the same key is replaced. Entries for the same target
    // that :entry satisfies (i.e., less complete ones) are removed. The return
    // value is the number of entries removed that way.
    //
    // The entry's serial number is assigned by the store.
    //
    size_t
    insert(cache_key const& key, cache_entry entry);

    // Remove the entry for :key. Returns whether or not there was one.
    // This doesn't affect the counters.
    bool
    remove(cache_key const& key);

    // Remove all entries for :target_key.target (at any depth).
    // (:target_key.depth is ignored.)
    // The return value is the number of entries removed.
    size_t
    invalidate_target(cache_key const& target_key);

    // Remove all entries for :target_key.target and its descendants.
    size_t
    invalidate_subtree(cache_key const& target_key);

    // Remove all entries.
    size_t
    invalidate_all();

    // Evict entries (in LRU order) until there are at most :max_entries
    // entries and at most :max_memory bytes in use.
    // The return value is the number of entries evicted.
    size_t
    evict_until_within(size_t max_entries, size_t max_memory);

    // Get the depths at which :target_key.target is cached.
    std::set<integer>
    cached_depths(cache_key const& target_key) const;

 private:
    typedef std::unordered_map<
        cache_key,
        detail::cache_store_record,
        cache_key_hash>
        record_map;

    void
    erase_record(record_map::iterator i);

    size_t
    remove_depths(cache_key const& target_key, std::set<integer> depths);

    bool lru_ordered_;
    record_map records_;
    // the LRU list - The front is the least recently used entry.
    std::list<cache_key const*> lru_list_;
    // the depths at which each target is cached, keyed by the target's key
    // with depth 0
    std::map<cache_key, std::set<integer>> depth_index_;
    size_t memory_usage_ = 0;
    uint64_t next_serial_ = 1;
    cache_store_counters counters_;
};

} // namespace canopy

#endif
