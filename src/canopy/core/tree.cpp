#include <canopy/core/tree.hpp>

namespace canopy {

cppcoro::task<node_metadata>
tree_node::metadata() const
{
    co_return node_metadata();
}

std::vector<string>
get_identifiers(child_list const& children)
{
    std::vector<string> ids;
    ids.reserve(children.size());
    for (auto const& child : children)
        ids.push_back(child->identifier());
    return ids;
}

} // namespace canopy
