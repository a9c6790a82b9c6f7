#ifndef CANOPY_CACHING_ENTRY_HPP
#define CANOPY_CACHING_ENTRY_HPP

#include <canopy/caching/keys.hpp>
#include <canopy/core/tree.hpp>

namespace canopy {

// Depths describe how completely a target's subtree was scanned when its
// children were cached.
//
// - complete_depth means that the whole subtree was scanned. A complete
//   entry satisfies any request.
// - A depth N >= 0 means that the scan went N levels deep and more levels may
//   exist below. It satisfies requests for depths up to N.
//
integer constexpr complete_depth = -1;

// the default ceiling for non-complete depths
integer constexpr default_max_depth = 100;

// Does a scan of depth :available satisfy a request for depth :requested?
inline bool
depth_satisfies(integer available, integer requested)
{
    if (available == complete_depth)
        return true;
    if (requested == complete_depth)
        return false;
    return available >= requested;
}

// Get whichever of :a and :b describes the more complete scan.
inline integer
deeper_of(integer a, integer b)
{
    return depth_satisfies(a, b) ? a : b;
}

// Is :depth a valid depth when depths are limited to :max_depth?
inline bool
is_valid_depth(integer depth, integer max_depth)
{
    return depth == complete_depth || (depth >= 0 && depth <= max_depth);
}

struct cache_entry
{
    // the cached children
    child_list data;

    // the depth of the scan that produced :data
    integer depth = complete_depth;

    // the target's modification time when :data was cached (if known)
    optional<double> mtime;

    // when the entry was cached (or last validated), in seconds
    double cached_at = 0;

    // how many times the entry has been used to answer a request
    integer access_count = 0;

    // the estimated memory footprint of the entry, in bytes
    size_t size_estimate = 0;

    // a number that's unique to this entry within its store - This lets
    // callers that released the store's lock check that an entry they looked
    // at earlier hasn't been replaced in the meantime.
    uint64_t serial = 0;

    bool
    satisfies(integer requested) const
    {
        return depth_satisfies(depth, requested);
    }

    bool
    is_complete() const
    {
        return depth == complete_depth;
    }
};

// Estimate the memory needed to cache :children under :key.
// This is a heuristic. It accounts for the key, the list itself and the
// identifiers of the children, which dominate for path-like sources.
size_t
estimate_entry_size(cache_key const& key, child_list const& children);

} // namespace canopy

#endif
