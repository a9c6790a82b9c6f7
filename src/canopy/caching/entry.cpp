#include <canopy/caching/entry.hpp>

namespace canopy {

// per-entry bookkeeping (map node, LRU list node, index slot)
size_t constexpr entry_overhead = 200;
// per-child overhead (shared_ptr, control block, node object)
size_t constexpr child_overhead = 64;

size_t
estimate_entry_size(cache_key const& key, child_list const& children)
{
    size_t size = entry_overhead + sizeof(cache_entry) + sizeof(cache_key)
                  + key.class_id.size() + key.target.size();
    size += children.size() * (sizeof(tree_node_ptr) + child_overhead);
    for (auto const& child : children)
        size += child->identifier().size();
    return size;
}

} // namespace canopy
