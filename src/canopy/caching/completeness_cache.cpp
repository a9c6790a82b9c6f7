#include <canopy/caching/completeness_cache.hpp>

#include <cppcoro/shared_task.hpp>

#include <canopy/caching/internals.h>
#include <canopy/core/targets.hpp>
#include <canopy/utilities/errors.h>
#include <canopy/utilities/logging.hpp>

namespace canopy {

char const*
get_fetch_outcome_name(fetch_outcome outcome)
{
    switch (outcome)
    {
        case fetch_outcome::HIT:
        default:
            return "hit";
        case fetch_outcome::MISS:
            return "miss";
        case fetch_outcome::SUPERSEDED:
            return "superseded";
        case fetch_outcome::BYPASSED:
            return "bypassed";
    }
}

namespace detail {

completeness_cache_internals::completeness_cache_internals(
    std::shared_ptr<tree_source> base,
    resolved_cache_config const& config,
    time_source clock,
    cache_identity identity)
    : base(std::move(base)),
      base_cache(dynamic_cast<completeness_cache*>(this->base.get())),
      config(config),
      identity(std::move(identity)),
      guard(make_cache_limits(config)),
      validator(config.validation_ttl_seconds, std::move(clock)),
      store(config.enable_oom_protection),
      tracker(config.enable_oom_protection, size_t(config.max_tracked_nodes))
{
}

namespace {

integer
resolve_requested_depth(
    completeness_cache_internals& cache, optional<integer> const& depth)
{
    integer resolved;
    if (depth)
    {
        resolved = *depth;
    }
    else
    {
        std::scoped_lock<std::mutex> lock(cache.mutex);
        resolved = cache.depth_context.value_or(cache.config.default_depth);
    }
    if (!is_valid_depth(resolved, cache.config.max_depth))
    {
        CANOPY_THROW(
            invalid_depth_error()
            << requested_depth_info(resolved)
            << max_depth_info(cache.config.max_depth));
    }
    return resolved;
}

cppcoro::task<child_list>
fetch_from_base(
    completeness_cache_internals& cache, tree_node const& node, integer depth)
{
    if (cache.base_cache)
        co_return co_await cache.base_cache->get_children(node, true, depth);
    co_return co_await cache.base->get_children(node);
}

// Fetch the children for :key from the base source and cache them (if the
// guard allows it). This is the body of the shared task that's registered
// in the in-flight registry, so it also takes care of removing that entry.
cppcoro::shared_task<fetch_result>
fetch_and_store(
    completeness_cache_internals& cache, tree_node const& node, cache_key key)
{
    fetch_registry::removal_guard registration(
        cache.in_flight, cache.mutex, key);

    // The modification time is read before the fetch so that any change
    // that happens during the fetch is caught by the next validation.
    optional<double> mtime;
    if (cache.validator.ttl_seconds() >= 0)
        mtime = co_await read_modification_time(node);

    child_list children;
    try
    {
        children = co_await fetch_from_base(cache, node, key.depth);
    }
    catch (std::exception& e)
    {
        get_logger()->warn(
            "[cache] failed to fetch children of {}: {}", key.target, e.what());
        throw;
    }

    auto outcome = fetch_outcome::MISS;
    {
        std::scoped_lock<std::mutex> lock(cache.mutex);

        for (auto const& child : children)
        {
            cache.tracker.record_discovery(
                normalize_target(child->identifier()));
        }

        size_t size = estimate_entry_size(key, children);
        auto admission = cache.guard.admit(key.target, key.depth, size);
        if (admission == cache_admission::ACCEPTED)
        {
            cache_entry entry;
            entry.data = children;
            entry.depth = key.depth;
            entry.mtime = mtime;
            entry.cached_at = cache.validator.now();
            entry.size_estimate = size;
            if (cache.store.insert(key, std::move(entry)) != 0)
                outcome = fetch_outcome::SUPERSEDED;
            size_t evicted = cache.guard.enforce(cache.store);
            if (evicted != 0)
            {
                get_logger()->debug(
                    "[cache] evicted {} entries ({} remaining, {} bytes)",
                    evicted,
                    cache.store.size(),
                    cache.store.memory_usage());
            }
        }
        else
        {
            get_logger()->debug(
                "[cache] not caching {} at depth {}: {}",
                key.target,
                key.depth,
                get_cache_admission_name(admission));
        }
    }

    co_return fetch_result{std::move(children), outcome};
}

} // namespace

} // namespace detail

completeness_cache::completeness_cache(
    std::shared_ptr<tree_source> base,
    completeness_cache_config const& config,
    time_source clock,
    cache_key_allocator& allocator)
{
    auto resolved = resolve_cache_config(config);
    impl_ = std::make_unique<detail::completeness_cache_internals>(
        std::move(base),
        resolved,
        std::move(clock),
        allocator.allocate_identity("completeness_cache"));
}

completeness_cache::~completeness_cache()
{
}

cppcoro::task<child_list>
completeness_cache::get_children(tree_node const& node)
{
    auto result = co_await get_or_fetch(node, true, none);
    co_return std::move(result.children);
}

cppcoro::task<child_list>
completeness_cache::get_children(
    tree_node const& node, bool use_cache, optional<integer> depth)
{
    auto result = co_await get_or_fetch(node, use_cache, depth);
    co_return std::move(result.children);
}

cppcoro::task<fetch_result>
completeness_cache::get_or_fetch(
    tree_node const& node, bool use_cache, optional<integer> depth)
{
    auto& cache = *impl_;
    integer requested = detail::resolve_requested_depth(cache, depth);

    if (!use_cache)
    {
        {
            std::scoped_lock<std::mutex> lock(cache.mutex);
            ++cache.counters.bypasses;
        }
        auto children
            = co_await detail::fetch_from_base(cache, node, requested);
        co_return fetch_result{std::move(children), fetch_outcome::BYPASSED};
    }

    auto key = make_cache_key(
        cache.identity,
        cache_key_kind::COMPLETENESS,
        normalize_target(node.identifier()),
        requested);

    // The node's current modification time - It's read at most once per
    // request, however many entries need validating.
    bool mtime_checked = false;
    optional<double> current_mtime;

    cppcoro::shared_task<fetch_result> fetch;
    while (true)
    {
        cache_key matched_key;
        uint64_t matched_serial = 0;
        {
            std::scoped_lock<std::mutex> lock(cache.mutex);
            cache.tracker.record_expansion(key.target, requested);

            auto match = cache.store.find_satisfying(key);
            if (!match)
            {
                ++cache.counters.misses;
                auto joined = cache.in_flight.join_or_start(key, [&] {
                    return detail::fetch_and_store(cache, node, key);
                });
                if (!joined.second)
                    ++cache.counters.coalesced_waits;
                fetch = std::move(joined.first);
                break;
            }

            double now = cache.validator.now();
            bool needs_validation
                = cache.validator.needs_validation(*match->entry, now);
            if (!needs_validation
                || (mtime_checked
                    && cache.validator.is_still_valid(
                        *match->entry, current_mtime)))
            {
                auto* entry
                    = cache.store.use(match->key, match->entry->serial);
                if (needs_validation)
                    entry->cached_at = now;
                ++cache.counters.hits;
                // Copy the children while the entry is known to be alive.
                co_return fetch_result{entry->data, fetch_outcome::HIT};
            }
            if (mtime_checked)
            {
                cache.store.remove(match->key);
                ++cache.counters.stale_entries;
                get_logger()->debug(
                    "[cache] {} changed since it was cached at depth {}",
                    key.target,
                    match->key.depth);
                continue;
            }
            matched_key = match->key;
            matched_serial = match->entry->serial;
        }

        current_mtime = co_await read_modification_time(node);
        mtime_checked = true;

        // Now that we know the current modification time, check the entry
        // again (if it's still there).
        {
            std::scoped_lock<std::mutex> lock(cache.mutex);
            auto* entry = cache.store.lookup(matched_key, matched_serial);
            if (entry && !cache.validator.is_still_valid(*entry, current_mtime))
            {
                cache.store.remove(matched_key);
                ++cache.counters.stale_entries;
                get_logger()->debug(
                    "[cache] {} changed since it was cached at depth {}",
                    key.target,
                    matched_key.depth);
            }
        }
    }

    co_return co_await fetch;
}

void
completeness_cache::set_depth_context(optional<integer> depth)
{
    auto& cache = *impl_;
    if (depth && !is_valid_depth(*depth, cache.config.max_depth))
    {
        CANOPY_THROW(
            invalid_depth_error() << requested_depth_info(*depth)
                                  << max_depth_info(cache.config.max_depth));
    }
    std::scoped_lock<std::mutex> lock(cache.mutex);
    cache.depth_context = depth;
}

integer
completeness_cache::current_depth() const
{
    auto& cache = *impl_;
    std::scoped_lock<std::mutex> lock(cache.mutex);
    return cache.depth_context.value_or(cache.config.default_depth);
}

size_t
completeness_cache::invalidate(string const& target, bool deep)
{
    auto normalized = normalize_target(target);
    if (normalized.empty())
        CANOPY_THROW(invalid_target_error() << target_info(target));
    if (deep && is_root_target(normalized))
        return invalidate_all();

    auto& cache = *impl_;
    auto key = make_cache_key(
        cache.identity, cache_key_kind::COMPLETENESS, normalized, 0);
    size_t count;
    {
        std::scoped_lock<std::mutex> lock(cache.mutex);
        count = deep ? cache.store.invalidate_subtree(key)
                     : cache.store.invalidate_target(key);
    }
    get_logger()->debug(
        "[cache] invalidated {} entries for {}{}",
        count,
        normalized,
        deep ? " (deep)" : "");
    return count;
}

size_t
completeness_cache::invalidate_all()
{
    auto& cache = *impl_;
    size_t count;
    {
        std::scoped_lock<std::mutex> lock(cache.mutex);
        count = cache.store.invalidate_all();
        cache.tracker.clear();
    }
    get_logger()->debug("[cache] invalidated all {} entries", count);
    return count;
}

size_t
completeness_cache::invalidate_node(tree_node const* node, bool deep)
{
    if (!node)
    {
        CANOPY_THROW(
            invalid_target_error()
            << internal_error_message_info("null node"));
    }
    auto identifier = node->identifier();
    if (identifier.empty())
    {
        CANOPY_THROW(
            invalid_target_error()
            << target_info(identifier)
            << internal_error_message_info("node has no identifier"));
    }
    return invalidate(identifier, deep);
}

size_t
completeness_cache::invalidate_nodes(
    std::vector<tree_node const*> const& nodes, bool deep, bool ignore_errors)
{
    size_t count = 0;
    for (auto const* node : nodes)
    {
        try
        {
            count += invalidate_node(node, deep);
        }
        catch (invalid_target_error& e)
        {
            if (!ignore_errors)
                throw;
            get_logger()->debug("[cache] skipping node: {}", e.what());
        }
    }
    return count;
}

cache_stats
completeness_cache::get_stats() const
{
    auto& cache = *impl_;
    std::scoped_lock<std::mutex> lock(cache.mutex);
    cache_stats stats;
    stats.hits = cache.counters.hits;
    stats.misses = cache.counters.misses;
    stats.bypasses = cache.counters.bypasses;
    stats.coalesced_waits = cache.counters.coalesced_waits;
    stats.stale_entries = cache.counters.stale_entries;
    auto const& store_counters = cache.store.counters();
    stats.evictions = store_counters.evictions;
    stats.invalidations = store_counters.invalidations;
    stats.upgrades = store_counters.upgrades;
    stats.entries = integer(cache.store.size());
    stats.memory_bytes = integer(cache.store.memory_usage());
    stats.tracked_nodes = integer(cache.tracker.size());
    integer requests = stats.hits + stats.misses;
    stats.hit_rate = requests != 0 ? double(stats.hits) / double(requests) : 0;
    return stats;
}

optional<integer>
completeness_cache::tracked_depth(string const& target) const
{
    auto& cache = *impl_;
    std::scoped_lock<std::mutex> lock(cache.mutex);
    return cache.tracker.expansion_depth(normalize_target(target));
}

bool
completeness_cache::was_discovered(string const& target) const
{
    auto& cache = *impl_;
    std::scoped_lock<std::mutex> lock(cache.mutex);
    return cache.tracker.was_discovered(normalize_target(target));
}

bool
completeness_cache::was_expanded(string const& target) const
{
    auto& cache = *impl_;
    std::scoped_lock<std::mutex> lock(cache.mutex);
    return cache.tracker.was_expanded(normalize_target(target));
}

size_t
completeness_cache::in_flight_count() const
{
    auto& cache = *impl_;
    std::scoped_lock<std::mutex> lock(cache.mutex);
    return cache.in_flight.size();
}

cache_identity const&
completeness_cache::identity() const
{
    return impl_->identity;
}

resolved_cache_config const&
completeness_cache::config() const
{
    return impl_->config;
}

} // namespace canopy
