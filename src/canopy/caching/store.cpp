#include <canopy/caching/store.hpp>

#include <vector>

#include <canopy/core/targets.hpp>

namespace canopy {

namespace {

// Get the key that identifies :key's target within the depth index.
cache_key
target_key_of(cache_key key)
{
    key.depth = 0;
    return key;
}

cache_key
with_depth(cache_key key, integer depth)
{
    key.depth = depth;
    return key;
}

} // namespace

cache_store::cache_store(bool lru_ordered) : lru_ordered_(lru_ordered)
{
}

cache_entry const*
cache_store::find(cache_key const& key) const
{
    auto i = records_.find(key);
    return i != records_.end() ? &i->second.entry : nullptr;
}

optional<cache_store_match>
cache_store::find_satisfying(cache_key const& request) const
{
    if (auto const* entry = this->find(request))
        return cache_store_match{request, entry};

    if (request.depth != complete_depth)
    {
        auto complete_key = with_depth(request, complete_depth);
        if (auto const* entry = this->find(complete_key))
            return cache_store_match{complete_key, entry};
    }

    auto index = depth_index_.find(target_key_of(request));
    if (index != depth_index_.end() && !index->second.empty())
    {
        // The set is ordered, so the last depth is the deepest partial one.
        // (If there were a complete entry, we would have found it above.)
        integer deepest = *index->second.rbegin();
        if (depth_satisfies(deepest, request.depth))
        {
            auto deepest_key = with_depth(request, deepest);
            if (auto const* entry = this->find(deepest_key))
                return cache_store_match{deepest_key, entry};
        }
    }

    return none;
}

cache_entry*
cache_store::use(cache_key const& key, uint64_t serial)
{
    auto i = records_.find(key);
    if (i == records_.end() || i->second.entry.serial != serial)
        return nullptr;
    auto& record = i->second;
    if (lru_ordered_)
        lru_list_.splice(lru_list_.end(), lru_list_, record.lru_position);
    ++record.entry.access_count;
    return &record.entry;
}

cache_entry*
cache_store::lookup(cache_key const& key, uint64_t serial)
{
    auto i = records_.find(key);
    if (i == records_.end() || i->second.entry.serial != serial)
        return nullptr;
    return &i->second.entry;
}

size_t
cache_store::insert(cache_key const& key, cache_entry entry)
{
    auto target_key = target_key_of(key);

    std::set<integer> superseded;
    auto index = depth_index_.find(target_key);
    if (index != depth_index_.end())
    {
        for (integer depth : index->second)
        {
            if (depth != key.depth && depth_satisfies(key.depth, depth))
                superseded.insert(depth);
        }
    }
    size_t superseded_count = remove_depths(target_key, superseded);
    if (superseded_count != 0)
        ++counters_.upgrades;

    this->remove(key);

    entry.serial = next_serial_++;
    size_t size = entry.size_estimate;
    auto i = records_
                 .emplace(
                     key,
                     detail::cache_store_record{
                         std::move(entry),
                         std::list<cache_key const*>::iterator()})
                 .first;
    if (lru_ordered_)
    {
        i->second.lru_position
            = lru_list_.insert(lru_list_.end(), &i->first);
    }
    depth_index_[target_key].insert(key.depth);
    memory_usage_ += size;

    return superseded_count;
}

void
cache_store::erase_record(record_map::iterator i)
{
    if (lru_ordered_)
        lru_list_.erase(i->second.lru_position);

    auto index = depth_index_.find(target_key_of(i->first));
    if (index != depth_index_.end())
    {
        index->second.erase(i->first.depth);
        if (index->second.empty())
            depth_index_.erase(index);
    }

    memory_usage_ -= i->second.entry.size_estimate;
    records_.erase(i);
}

bool
cache_store::remove(cache_key const& key)
{
    auto i = records_.find(key);
    if (i == records_.end())
        return false;
    erase_record(i);
    return true;
}

size_t
cache_store::remove_depths(
    cache_key const& target_key, std::set<integer> depths)
{
    size_t count = 0;
    for (integer depth : depths)
    {
        if (this->remove(with_depth(target_key, depth)))
            ++count;
    }
    return count;
}

std::set<integer>
cache_store::cached_depths(cache_key const& target_key) const
{
    auto index = depth_index_.find(target_key_of(target_key));
    return index != depth_index_.end() ? index->second : std::set<integer>();
}

size_t
cache_store::invalidate_target(cache_key const& target_key)
{
    size_t count = remove_depths(target_key, cached_depths(target_key));
    counters_.invalidations += count;
    return count;
}

size_t
cache_store::invalidate_subtree(cache_key const& target_key)
{
    auto root = target_key_of(target_key);

    // All targets that have :root.target as a prefix are contiguous in the
    // index, starting at :root itself.
    std::vector<std::pair<cache_key, std::set<integer>>> doomed;
    for (auto i = depth_index_.lower_bound(root); i != depth_index_.end(); ++i)
    {
        auto const& candidate = i->first;
        if (candidate.class_id != root.class_id
            || candidate.instance_id != root.instance_id
            || candidate.kind != root.kind
            || candidate.target.compare(0, root.target.size(), root.target)
                   != 0)
        {
            break;
        }
        if (is_same_or_descendant(candidate.target, root.target))
            doomed.emplace_back(candidate, i->second);
    }

    size_t count = 0;
    for (auto const& [key, depths] : doomed)
        count += remove_depths(key, depths);
    counters_.invalidations += count;
    return count;
}

size_t
cache_store::invalidate_all()
{
    size_t count = records_.size();
    lru_list_.clear();
    depth_index_.clear();
    records_.clear();
    memory_usage_ = 0;
    counters_.invalidations += count;
    return count;
}

size_t
cache_store::evict_until_within(size_t max_entries, size_t max_memory)
{
    size_t evicted = 0;
    while (!records_.empty()
           && (records_.size() > max_entries || memory_usage_ > max_memory))
    {
        auto victim = lru_ordered_ ? records_.find(*lru_list_.front())
                                   : records_.begin();
        erase_record(victim);
        ++evicted;
    }
    counters_.evictions += evicted;
    return evicted;
}

} // namespace canopy
