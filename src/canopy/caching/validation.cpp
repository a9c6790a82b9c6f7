#include <canopy/caching/validation.hpp>

#include <chrono>
#include <cmath>

#include <canopy/utilities/logging.hpp>

namespace canopy {

time_source
system_time_source()
{
    return [] {
        return std::chrono::duration<double>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    };
}

bool
mtimes_match(double a, double b)
{
    return std::fabs(a - b) <= 0.001;
}

cppcoro::task<optional<double>>
read_modification_time(tree_node const& node)
{
    try
    {
        auto metadata = co_await node.metadata();
        co_return metadata.modified_time;
    }
    catch (std::exception& e)
    {
        get_logger()->debug(
            "unable to read metadata for {}: {}", node.identifier(), e.what());
    }
    co_return none;
}

bool
staleness_validator::needs_validation(
    cache_entry const& entry, double now) const
{
    return entry.mtime && ttl_seconds_ >= 0
           && now - entry.cached_at >= ttl_seconds_;
}

bool
staleness_validator::is_still_valid(
    cache_entry const& entry, optional<double> const& current_mtime) const
{
    if (!entry.mtime || !current_mtime)
        return true;
    return mtimes_match(*entry.mtime, *current_mtime);
}

} // namespace canopy
