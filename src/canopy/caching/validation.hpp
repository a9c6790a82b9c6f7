#ifndef CANOPY_CACHING_VALIDATION_HPP
#define CANOPY_CACHING_VALIDATION_HPP

#include <functional>

#include <cppcoro/task.hpp>

#include <canopy/caching/entry.hpp>
#include <canopy/core/tree.hpp>

namespace canopy {

// A time_source supplies the current time, in seconds.
// Caches take one so that tests can control the passage of time.
typedef std::function<double()> time_source;

// the wall clock, in seconds since the epoch
time_source
system_time_source();

// Do two modification times describe the same version of a node?
// (They're allowed to differ by up to a millisecond, since some sources
// round their timestamps.)
bool
mtimes_match(double a, double b);

// Read the modification time of :node.
// Sources report errors in all sorts of ways. Any failure to read the
// metadata is logged and treated as "no modification time".
cppcoro::task<optional<double>>
read_modification_time(tree_node const& node);

// A staleness_validator decides when a cached entry must be checked against
// its node's current modification time.
struct staleness_validator
{
    staleness_validator(double ttl_seconds, time_source clock)
        : ttl_seconds_(ttl_seconds), clock_(std::move(clock))
    {
    }

    double
    ttl_seconds() const
    {
        return ttl_seconds_;
    }

    double
    now() const
    {
        return clock_();
    }

    // Does :entry need to be checked before it's served at time :now?
    // Entries without an mtime are never checked, and a negative TTL
    // disables checks altogether.
    bool
    needs_validation(cache_entry const& entry, double now) const;

    // Given the current modification time of an entry's node, is the entry
    // still valid? If the current time couldn't be read, the entry is
    // assumed to be valid.
    bool
    is_still_valid(
        cache_entry const& entry, optional<double> const& current_mtime) const;

 private:
    double ttl_seconds_;
    time_source clock_;
};

} // namespace canopy

#endif
