#ifndef CANOPY_CORE_TREE_HPP
#define CANOPY_CORE_TREE_HPP

#include <memory>
#include <vector>

#include <cppcoro/task.hpp>

#include <canopy/core/type_definitions.hpp>

// This file defines the minimal interface between the caches and the
// hierarchical sources that they wrap.
//
// A source enumerates the children of a node. Nodes name themselves with a
// stable identifier (a '/'-separated path for filesystem-like sources) and
// may expose metadata, the only part of which the caches care about is the
// modification time.

namespace canopy {

struct node_metadata
{
    // the node's modification time, in seconds - none if the source can't
    // supply one, in which case no staleness checks are performed
    optional<double> modified_time;

    // the size of the node, in bytes, if applicable
    optional<integer> size;

    bool is_directory = false;
};

struct tree_node
{
    virtual ~tree_node()
    {
    }

    // Get the stable identifier for this node.
    virtual string
    identifier() const = 0;

    // Get the metadata for this node.
    // The default implementation reports no metadata at all.
    virtual cppcoro::task<node_metadata>
    metadata() const;
};

typedef std::shared_ptr<tree_node const> tree_node_ptr;

// the (ordered) children of a node
typedef std::vector<tree_node_ptr> child_list;

struct tree_source
{
    virtual ~tree_source()
    {
    }

    // Enumerate the children of :node.
    // :node must remain valid until the returned task completes.
    virtual cppcoro::task<child_list>
    get_children(tree_node const& node) = 0;
};

// Get the identifiers of all nodes in a child list.
std::vector<string>
get_identifiers(child_list const& children);

} // namespace canopy

#endif
