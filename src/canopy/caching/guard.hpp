#ifndef CANOPY_CACHING_GUARD_HPP
#define CANOPY_CACHING_GUARD_HPP

#include <canopy/caching/config.hpp>
#include <canopy/caching/store.hpp>

namespace canopy {

// the limits that a resource_guard enforces
struct cache_limits
{
    bool enabled = true;
    size_t max_entries = 10000;
    size_t max_memory_bytes = size_t(100) << 20;
    integer max_cache_depth = 50;
    integer max_path_depth = 30;
};

cache_limits
make_cache_limits(resolved_cache_config const& config);

// the guard's decision about whether a freshly fetched result is cached
enum class cache_admission
{
    ACCEPTED,
    // The requested depth exceeds max_cache_depth.
    DEPTH_TOO_LARGE,
    // The target has more path components than max_path_depth.
    PATH_TOO_DEEP,
    // max_entries is 0.
    CACHING_DISABLED,
    // The entry alone would exceed the memory limit.
    ENTRY_TOO_LARGE
};

char const*
get_cache_admission_name(cache_admission admission);

// A resource_guard sits in front of a cache_store and keeps it within a set
// of limits. Rejected results are still returned to the caller. They just
// aren't cached.
struct resource_guard
{
    explicit resource_guard(cache_limits const& limits) : limits_(limits)
    {
    }

    cache_limits const&
    limits() const
    {
        return limits_;
    }

    // Decide whether an entry of :size_estimate bytes for :target, fetched
    // at :requested_depth, may be cached.
    cache_admission
    admit(
        string const& target,
        integer requested_depth,
        size_t size_estimate) const;

    // Evict entries from :store until it's within limits again.
    // Returns the number of entries evicted. (This is a no-op when the
    // guard is disabled.)
    size_t
    enforce(cache_store& store) const;

 private:
    cache_limits limits_;
};

} // namespace canopy

#endif
