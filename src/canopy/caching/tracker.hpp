#ifndef CANOPY_CACHING_TRACKER_HPP
#define CANOPY_CACHING_TRACKER_HPP

#include <list>
#include <unordered_map>

#include <canopy/caching/entry.hpp>

namespace canopy {

// A node_completeness_tracker records which targets have been discovered
// (seen as the child of an expanded node) and which have been expanded
// (had their children requested), along with the deepest depth at which
// each was expanded. It's purely observational. Nothing in the caching
// logic depends on what it records.
//
// The tracker has its own capacity, independent of the cache entries. When
// it's LRU-ordered and full, recording a new target drops the least recently
// recorded one. An unordered tracker is unbounded.
//
// Like the store, the tracker isn't internally synchronized.
//
struct node_completeness_tracker : noncopyable
{
    node_completeness_tracker(bool lru_ordered, size_t capacity);

    // Record that :target was seen as a child.
    void
    record_discovery(string const& target);

    // Record that :target was expanded at :depth.
    // The recorded depth only ever becomes more complete.
    void
    record_expansion(string const& target, integer depth);

    bool
    was_discovered(string const& target) const;

    bool
    was_expanded(string const& target) const;

    // Get the deepest depth at which :target has been expanded, if any.
    optional<integer>
    expansion_depth(string const& target) const;

    size_t
    size() const
    {
        return records_.size();
    }

    size_t
    capacity() const
    {
        return capacity_;
    }

    void
    clear();

 private:
    struct tracked_node
    {
        bool discovered = false;
        optional<integer> expansion_depth;
        std::list<string const*>::iterator lru_position;
    };

    // Get the record for :target, creating it if necessary, and mark it as
    // the most recently recorded. Returns nullptr if the tracker can't hold
    // any records at all.
    tracked_node*
    touch(string const& target);

    tracked_node const*
    find(string const& target) const;

    bool lru_ordered_;
    size_t capacity_;
    std::unordered_map<string, tracked_node> records_;
    // The front is the least recently recorded target.
    std::list<string const*> lru_list_;
};

} // namespace canopy

#endif
