#include <canopy/caching/guard.hpp>

#include <limits>

#include <canopy/core/targets.hpp>

namespace canopy {

cache_limits
make_cache_limits(resolved_cache_config const& config)
{
    cache_limits limits;
    limits.enabled = config.enable_oom_protection;
    limits.max_entries = size_t(config.max_entries);
    double bytes = config.max_memory_mb * double(size_t(1) << 20);
    // Anything at or beyond the range of size_t is effectively unlimited.
    limits.max_memory_bytes
        = bytes >= double(std::numeric_limits<size_t>::max())
              ? std::numeric_limits<size_t>::max()
              : size_t(bytes);
    limits.max_cache_depth = config.max_cache_depth;
    limits.max_path_depth = config.max_path_depth;
    return limits;
}

char const*
get_cache_admission_name(cache_admission admission)
{
    switch (admission)
    {
        case cache_admission::ACCEPTED:
        default:
            return "accepted";
        case cache_admission::DEPTH_TOO_LARGE:
            return "depth too large";
        case cache_admission::PATH_TOO_DEEP:
            return "path too deep";
        case cache_admission::CACHING_DISABLED:
            return "caching disabled";
        case cache_admission::ENTRY_TOO_LARGE:
            return "entry too large";
    }
}

cache_admission
resource_guard::admit(
    string const& target, integer requested_depth, size_t size_estimate) const
{
    if (!limits_.enabled)
        return cache_admission::ACCEPTED;
    if (limits_.max_entries == 0)
        return cache_admission::CACHING_DISABLED;
    if (requested_depth != complete_depth
        && requested_depth > limits_.max_cache_depth)
    {
        return cache_admission::DEPTH_TOO_LARGE;
    }
    if (path_depth(target) > limits_.max_path_depth)
        return cache_admission::PATH_TOO_DEEP;
    if (size_estimate > limits_.max_memory_bytes)
        return cache_admission::ENTRY_TOO_LARGE;
    return cache_admission::ACCEPTED;
}

size_t
resource_guard::enforce(cache_store& store) const
{
    if (!limits_.enabled)
        return 0;
    return store.evict_until_within(
        limits_.max_entries, limits_.max_memory_bytes);
}

} // namespace canopy
