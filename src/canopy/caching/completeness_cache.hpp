#ifndef CANOPY_CACHING_COMPLETENESS_CACHE_HPP
#define CANOPY_CACHING_COMPLETENESS_CACHE_HPP

#include <memory>
#include <vector>

#include <cppcoro/task.hpp>

#include <canopy/caching/config.hpp>
#include <canopy/caching/keys.hpp>
#include <canopy/caching/validation.hpp>
#include <canopy/core/tree.hpp>

// A completeness_cache wraps a tree_source and caches the children that it
// enumerates, tagged with the depth of the scan that requested them.
//
// A request for a node at depth D is satisfied by any cached entry for that
// node whose depth is at least D (or complete). So after a scan to depth 10,
// scans to depths 0 through 10 are all hits, and a subsequent scan to depth
// 15 replaces the depth 10 entry.
//
// Concurrent misses for the same node and depth share a single fetch, and
// cached entries are checked against their node's modification time once
// they're older than the validation TTL.
//
// A completeness_cache is itself a tree_source, so caches can be stacked.
// Each instance has its own identity, so stacked instances never share
// entries.
//
// All methods are safe to call concurrently.

namespace canopy {

namespace detail {

struct completeness_cache_internals;

} // namespace detail

enum class fetch_outcome
{
    // A cached entry satisfied the request.
    HIT,
    // The children were fetched from the source.
    MISS,
    // The children were fetched from the source, and the new entry replaced
    // one or more less complete entries for the same node.
    SUPERSEDED,
    // The cache was bypassed at the caller's request.
    BYPASSED
};

char const*
get_fetch_outcome_name(fetch_outcome outcome);

struct fetch_result
{
    child_list children;
    fetch_outcome outcome;
};

struct cache_stats
{
    integer hits = 0;
    // Requests that joined an in-flight fetch count as misses too.
    integer misses = 0;
    integer evictions = 0;
    // the number of entries removed by invalidation calls
    integer invalidations = 0;
    integer bypasses = 0;
    integer upgrades = 0;
    integer entries = 0;
    integer memory_bytes = 0;
    // hits / (hits + misses), or 0 if there haven't been any requests
    double hit_rate = 0;
    // requests that waited on another request's fetch
    integer coalesced_waits = 0;
    // entries discarded because their node's modification time changed
    integer stale_entries = 0;
    integer tracked_nodes = 0;
};

struct completeness_cache : tree_source, noncopyable
{
    completeness_cache(
        std::shared_ptr<tree_source> base,
        completeness_cache_config const& config = completeness_cache_config(),
        time_source clock = system_time_source(),
        cache_key_allocator& allocator = default_cache_key_allocator());

    ~completeness_cache();

    // Get the children of :node at the current depth context.
    cppcoro::task<child_list>
    get_children(tree_node const& node) override;

    // Get the children of :node at :depth (or the current depth context if
    // that's omitted). If :use_cache is false, the source is queried directly
    // and nothing is cached.
    cppcoro::task<child_list>
    get_children(
        tree_node const& node, bool use_cache, optional<integer> depth = none);

    // Same as above, but also report how the request was answered.
    // :node must remain valid until the returned task completes.
    cppcoro::task<fetch_result>
    get_or_fetch(
        tree_node const& node,
        bool use_cache = true,
        optional<integer> depth = none);

    // Set the depth used by requests that don't specify one.
    // Passing none reverts to the configured default depth.
    void
    set_depth_context(optional<integer> depth);

    integer
    current_depth() const;

    // Remove all entries for :target (at every depth). If :deep is true,
    // entries for its descendants are removed as well.
    // Returns the number of entries removed.
    size_t
    invalidate(string const& target, bool deep = false);

    size_t
    invalidate_all();

    size_t
    invalidate_node(tree_node const* node, bool deep = false);

    // Invalidate several nodes at once. If :ignore_errors is true, nodes that
    // can't be resolved to a target are skipped. Otherwise, they throw
    // invalid_target_error (after the nodes before them are invalidated).
    size_t
    invalidate_nodes(
        std::vector<tree_node const*> const& nodes,
        bool deep = false,
        bool ignore_errors = false);

    cache_stats
    get_stats() const;

    // Get the deepest depth at which :target has been requested, if any.
    optional<integer>
    tracked_depth(string const& target) const;

    // Has :target been returned as the child of a fetched node?
    bool
    was_discovered(string const& target) const;

    // Have the children of :target been requested?
    bool
    was_expanded(string const& target) const;

    // the number of fetches currently in progress
    size_t
    in_flight_count() const;

    cache_identity const&
    identity() const;

    resolved_cache_config const&
    config() const;

 private:
    std::unique_ptr<detail::completeness_cache_internals> impl_;
};

} // namespace canopy

#endif
