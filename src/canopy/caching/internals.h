#ifndef CANOPY_CACHING_INTERNALS_H
#define CANOPY_CACHING_INTERNALS_H

#include <mutex>

#include <canopy/caching/completeness_cache.hpp>
#include <canopy/caching/guard.hpp>
#include <canopy/caching/in_flight.h>
#include <canopy/caching/store.hpp>
#include <canopy/caching/tracker.hpp>

namespace canopy {
namespace detail {

struct completeness_cache_counters
{
    integer hits = 0;
    integer misses = 0;
    integer bypasses = 0;
    integer coalesced_waits = 0;
    integer stale_entries = 0;
};

typedef in_flight_registry<cache_key, fetch_result, cache_key_hash>
    fetch_registry;

struct completeness_cache_internals : noncopyable
{
    completeness_cache_internals(
        std::shared_ptr<tree_source> base,
        resolved_cache_config const& config,
        time_source clock,
        cache_identity identity);

    // These remain constant for the life of the cache.
    std::shared_ptr<tree_source> base;
    // If the base is itself a completeness_cache, this points to it, so that
    // requested depths can be passed down.
    completeness_cache* base_cache;
    resolved_cache_config config;
    cache_identity identity;
    resource_guard guard;
    staleness_validator validator;

    // All of the following are protected by :mutex, which is never held
    // across a suspension point.
    std::mutex mutex;
    cache_store store;
    node_completeness_tracker tracker;
    fetch_registry in_flight;
    optional<integer> depth_context;
    completeness_cache_counters counters;
};

} // namespace detail
} // namespace canopy

#endif
