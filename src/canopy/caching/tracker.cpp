#include <canopy/caching/tracker.hpp>

namespace canopy {

node_completeness_tracker::node_completeness_tracker(
    bool lru_ordered, size_t capacity)
    : lru_ordered_(lru_ordered), capacity_(capacity)
{
}

node_completeness_tracker::tracked_node*
node_completeness_tracker::touch(string const& target)
{
    auto existing = records_.find(target);
    if (existing != records_.end())
    {
        auto& node = existing->second;
        if (lru_ordered_)
            lru_list_.splice(lru_list_.end(), lru_list_, node.lru_position);
        return &node;
    }

    if (lru_ordered_)
    {
        if (capacity_ == 0)
            return nullptr;
        while (records_.size() >= capacity_)
        {
            string oldest = *lru_list_.front();
            lru_list_.pop_front();
            records_.erase(oldest);
        }
    }

    auto i = records_.emplace(target, tracked_node()).first;
    if (lru_ordered_)
    {
        i->second.lru_position
            = lru_list_.insert(lru_list_.end(), &i->first);
    }
    return &i->second;
}

node_completeness_tracker::tracked_node const*
node_completeness_tracker::find(string const& target) const
{
    auto i = records_.find(target);
    return i != records_.end() ? &i->second : nullptr;
}

void
node_completeness_tracker::record_discovery(string const& target)
{
    if (auto* node = touch(target))
        node->discovered = true;
}

void
node_completeness_tracker::record_expansion(
    string const& target, integer depth)
{
    auto* node = touch(target);
    if (!node)
        return;
    node->expansion_depth = node->expansion_depth
                                ? deeper_of(*node->expansion_depth, depth)
                                : depth;
}

bool
node_completeness_tracker::was_discovered(string const& target) const
{
    auto const* node = find(target);
    return node && node->discovered;
}

bool
node_completeness_tracker::was_expanded(string const& target) const
{
    auto const* node = find(target);
    return node && node->expansion_depth;
}

optional<integer>
node_completeness_tracker::expansion_depth(string const& target) const
{
    auto const* node = find(target);
    if (!node)
        return none;
    return node->expansion_depth;
}

void
node_completeness_tracker::clear()
{
    lru_list_.clear();
    records_.clear();
}

} // namespace canopy
