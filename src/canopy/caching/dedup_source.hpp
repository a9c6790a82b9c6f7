#ifndef CANOPY_CACHING_DEDUP_SOURCE_HPP
#define CANOPY_CACHING_DEDUP_SOURCE_HPP

#include <memory>

#include <canopy/caching/keys.hpp>
#include <canopy/caching/validation.hpp>
#include <canopy/core/tree.hpp>

// A dedup_source is the lightweight alternative to completeness_cache. It
// caches the immediate children of each node for a fixed time, keeps at most
// a fixed number of entries (evicting in LRU order) and makes sure that
// concurrent requests for the same node only trigger one fetch.
//
// It knows nothing about depths. If mtime validation is enabled, entries for
// nodes that report a modification time are checked against it on every use
// instead of expiring.

namespace canopy {

namespace detail {

struct dedup_source_internals;

} // namespace detail

struct dedup_source_config
{
    // how long entries are kept, in seconds (defaults to 300)
    optional<double> ttl_seconds;

    // the maximum number of entries (defaults to 10,000)
    optional<integer> max_entries;

    // Check entries against their node's modification time?
    // (defaults to false)
    optional<bool> validate_mtime;
};

struct dedup_stats
{
    integer hits = 0;
    integer misses = 0;
    // requests that waited on another request's fetch
    integer concurrent_waits = 0;
    integer evictions = 0;
    // entries discarded because they expired or their node changed
    integer expired_entries = 0;
    integer entries = 0;
    double hit_rate = 0;
};

struct dedup_source : tree_source, noncopyable
{
    dedup_source(
        std::shared_ptr<tree_source> base,
        dedup_source_config const& config = dedup_source_config(),
        time_source clock = system_time_source(),
        cache_key_allocator& allocator = default_cache_key_allocator());

    ~dedup_source();

    cppcoro::task<child_list>
    get_children(tree_node const& node) override;

    // Drop all entries and reset the statistics.
    void
    clear();

    dedup_stats
    get_stats() const;

    cache_identity const&
    identity() const;

 private:
    std::unique_ptr<detail::dedup_source_internals> impl_;
};

} // namespace canopy

#endif
