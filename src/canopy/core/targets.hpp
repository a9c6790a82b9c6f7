#ifndef CANOPY_CORE_TARGETS_HPP
#define CANOPY_CORE_TARGETS_HPP

#include <canopy/core/type_definitions.hpp>

// Utilities for working with target identifiers.
//
// Targets are treated as '/'-separated hierarchical paths. Sources with
// other naming schemes still work with the caches, but descendant matching
// (deep invalidation) and path depth limits only make sense for path-like
// identifiers.

namespace canopy {

// Convert backslashes to slashes, collapse repeated separators and drop any
// trailing separator (except on the root itself).
string
normalize_target(string const& target);

// Is :target the root of an absolute hierarchy ("/")?
bool
is_root_target(string const& target);

// Get the number of components in :target.
// The root of an absolute path counts as a component, so "/a/b" has three
// and "a/b" has two.
integer
path_depth(string const& target);

// Is :candidate equal to :ancestor or somewhere beneath it?
// Both are expected to be normalized.
bool
is_same_or_descendant(string const& candidate, string const& ancestor);

} // namespace canopy

#endif
