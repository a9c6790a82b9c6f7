#include <canopy/caching/dedup_source.hpp>

#include <cmath>
#include <limits>
#include <mutex>

#include <cppcoro/shared_task.hpp>

#include <canopy/caching/in_flight.h>
#include <canopy/caching/store.hpp>
#include <canopy/core/targets.hpp>
#include <canopy/utilities/errors.h>
#include <canopy/utilities/logging.hpp>

namespace canopy {

namespace detail {

struct dedup_counters
{
    integer hits = 0;
    integer misses = 0;
    integer concurrent_waits = 0;
    integer expired_entries = 0;
};

typedef in_flight_registry<cache_key, child_list, cache_key_hash>
    children_registry;

struct dedup_source_internals : noncopyable
{
    std::shared_ptr<tree_source> base;
    double ttl_seconds;
    size_t max_entries;
    bool validate_mtime;
    time_source clock;
    cache_identity identity;

    // protected by :mutex
    std::mutex mutex;
    cache_store store;
    children_registry in_flight;
    dedup_counters counters;
};

namespace {

// Dedup entries are all stored at this depth.
integer constexpr children_depth = 1;

cppcoro::shared_task<child_list>
fetch_and_store(
    dedup_source_internals& source, tree_node const& node, cache_key key)
{
    children_registry::removal_guard registration(
        source.in_flight, source.mutex, key);

    optional<double> mtime;
    if (source.validate_mtime)
        mtime = co_await read_modification_time(node);

    child_list children;
    try
    {
        children = co_await source.base->get_children(node);
    }
    catch (std::exception& e)
    {
        get_logger()->warn(
            "[dedup] failed to fetch children of {}: {}", key.target, e.what());
        throw;
    }

    {
        std::scoped_lock<std::mutex> lock(source.mutex);
        if (source.max_entries != 0)
        {
            cache_entry entry;
            entry.data = children;
            entry.depth = children_depth;
            entry.mtime = mtime;
            entry.cached_at = source.clock();
            entry.size_estimate = estimate_entry_size(key, children);
            source.store.insert(key, std::move(entry));
            source.store.evict_until_within(
                source.max_entries, std::numeric_limits<size_t>::max());
        }
    }

    co_return children;
}

} // namespace

} // namespace detail

dedup_source::dedup_source(
    std::shared_ptr<tree_source> base,
    dedup_source_config const& config,
    time_source clock,
    cache_key_allocator& allocator)
    : impl_(std::make_unique<detail::dedup_source_internals>())
{
    auto& source = *impl_;
    source.base = std::move(base);
    source.ttl_seconds = config.ttl_seconds.value_or(300);
    if (std::isnan(source.ttl_seconds))
    {
        CANOPY_THROW(
            configuration_error() << config_option_info("ttl_seconds")
                                  << config_value_info("nan"));
    }
    integer max_entries = config.max_entries.value_or(10000);
    if (max_entries < 0)
    {
        CANOPY_THROW(
            configuration_error()
            << config_option_info("max_entries")
            << config_value_info(std::to_string(max_entries)));
    }
    source.max_entries = size_t(max_entries);
    source.validate_mtime = config.validate_mtime.value_or(false);
    source.clock = std::move(clock);
    source.identity = allocator.allocate_identity("dedup_source");
}

dedup_source::~dedup_source()
{
}

cppcoro::task<child_list>
dedup_source::get_children(tree_node const& node)
{
    auto& source = *impl_;
    auto key = make_cache_key(
        source.identity,
        cache_key_kind::CHILDREN,
        normalize_target(node.identifier()),
        detail::children_depth);

    cppcoro::shared_task<child_list> fetch;
    while (true)
    {
        uint64_t serial = 0;
        {
            std::scoped_lock<std::mutex> lock(source.mutex);
            auto const* entry = source.store.find(key);
            bool check_mtime = entry && source.validate_mtime && entry->mtime;
            if (entry && !check_mtime
                && source.clock() - entry->cached_at > source.ttl_seconds)
            {
                source.store.remove(key);
                ++source.counters.expired_entries;
                entry = nullptr;
            }
            if (!entry)
            {
                ++source.counters.misses;
                auto joined = source.in_flight.join_or_start(key, [&] {
                    return detail::fetch_and_store(source, node, key);
                });
                if (!joined.second)
                    ++source.counters.concurrent_waits;
                fetch = std::move(joined.first);
                break;
            }
            if (!check_mtime)
            {
                auto* used = source.store.use(key, entry->serial);
                ++source.counters.hits;
                co_return used->data;
            }
            serial = entry->serial;
        }

        auto current_mtime = co_await read_modification_time(node);
        {
            std::scoped_lock<std::mutex> lock(source.mutex);
            // If the entry was replaced in the meantime, check the new one.
            auto* entry = source.store.lookup(key, serial);
            if (!entry)
                continue;
            if (!current_mtime || mtimes_match(*entry->mtime, *current_mtime))
            {
                source.store.use(key, serial);
                ++source.counters.hits;
                co_return entry->data;
            }
            source.store.remove(key);
            ++source.counters.expired_entries;
        }
    }

    co_return co_await fetch;
}

void
dedup_source::clear()
{
    auto& source = *impl_;
    std::scoped_lock<std::mutex> lock(source.mutex);
    source.store.invalidate_all();
    source.counters = detail::dedup_counters();
}

dedup_stats
dedup_source::get_stats() const
{
    auto& source = *impl_;
    std::scoped_lock<std::mutex> lock(source.mutex);
    dedup_stats stats;
    stats.hits = source.counters.hits;
    stats.misses = source.counters.misses;
    stats.concurrent_waits = source.counters.concurrent_waits;
    stats.expired_entries = source.counters.expired_entries;
    stats.evictions = source.store.counters().evictions;
    stats.entries = integer(source.store.size());
    integer requests = stats.hits + stats.misses;
    stats.hit_rate = requests != 0 ? double(stats.hits) / double(requests) : 0;
    return stats;
}

cache_identity const&
dedup_source::identity() const
{
    return impl_->identity;
}

} // namespace canopy
