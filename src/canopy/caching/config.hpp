#ifndef CANOPY_CACHING_CONFIG_HPP
#define CANOPY_CACHING_CONFIG_HPP

#include <canopy/core/type_definitions.hpp>
#include <canopy/fs/types.hpp>

namespace canopy {

// the configuration of a completeness_cache - Any field that's omitted takes
// its default value.
struct completeness_cache_config
{
    // Enforce the limits below? (defaults to true)
    // Disabling this skips all admission checks and eviction, and switches
    // the store and the tracker to unordered (non-LRU) backing.
    optional<bool> enable_oom_protection;

    // the maximum number of cached entries (defaults to 10,000)
    optional<integer> max_entries;

    // the maximum (estimated) memory for cached entries, in MB
    // (defaults to 100)
    optional<double> max_memory_mb;

    // Requests deeper than this aren't cached. (defaults to 50)
    // Complete requests are always eligible.
    optional<integer> max_cache_depth;

    // Targets with more path components than this aren't cached.
    // (defaults to 30)
    optional<integer> max_path_depth;

    // the capacity of the node completeness tracker (defaults to 10,000)
    optional<integer> max_tracked_nodes;

    // how long an entry is served without checking its target's
    // modification time, in seconds (defaults to 5) - A negative value
    // disables validation entirely.
    optional<double> validation_ttl_seconds;

    // the largest non-complete depth that can be requested (defaults to 100)
    optional<integer> max_depth;

    // the depth used when a request doesn't specify one (defaults to 1)
    optional<integer> default_depth;
};

// completeness_cache_config with all defaults filled in
struct resolved_cache_config
{
    bool enable_oom_protection;
    integer max_entries;
    double max_memory_mb;
    integer max_cache_depth;
    integer max_path_depth;
    integer max_tracked_nodes;
    double validation_ttl_seconds;
    integer max_depth;
    integer default_depth;
};

// Fill in defaults and check that every value is within its valid range.
// Out-of-range values are reported as configuration_error.
resolved_cache_config
resolve_cache_config(completeness_cache_config const& config);

// Parse a JSON object into a cache config.
// Unknown options and values of the wrong type are configuration errors.
// (The values themselves are only range-checked by resolve_cache_config.)
completeness_cache_config
parse_cache_config(string const& json_text);

completeness_cache_config
read_cache_config_file(file_path const& path);

} // namespace canopy

#endif
