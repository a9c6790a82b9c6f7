#ifndef CANOPY_CACHING_KEYS_HPP
#define CANOPY_CACHING_KEYS_HPP

#include <mutex>
#include <ostream>
#include <unordered_map>

#include <canopy/core/type_definitions.hpp>

// Cache keys and the allocation of cache instance identities.
//
// Caches can be stacked (a cache wrapping another cache wrapping the real
// source), and several caches of the same kind may wrap the same source.
// Every cache instance therefore gets its own identity, and every key it
// builds carries that identity, so keys from different instances never
// compare equal, even when the instances are of the same class and are
// asked about the same target at the same depth.

namespace canopy {

enum class cache_key_kind
{
    // completeness-tagged child listings (completeness_cache)
    COMPLETENESS,
    // plain child listings (dedup_source)
    CHILDREN
};

char const*
get_cache_key_kind_name(cache_key_kind kind);

// the identity of a single cache instance
struct cache_identity
{
    string class_id;
    integer instance_id = 0;
};

bool
operator==(cache_identity const& a, cache_identity const& b);
bool
operator!=(cache_identity const& a, cache_identity const& b);

struct cache_key
{
    string class_id;
    integer instance_id = 0;
    cache_key_kind kind = cache_key_kind::COMPLETENESS;
    string target;
    // the requested depth (complete_depth for a complete scan)
    integer depth = 0;
};

bool
operator==(cache_key const& a, cache_key const& b);
bool
operator!=(cache_key const& a, cache_key const& b);
bool
operator<(cache_key const& a, cache_key const& b);

std::ostream&
operator<<(std::ostream& s, cache_key const& key);

size_t
hash_value(cache_key const& key);

struct cache_key_hash
{
    size_t
    operator()(cache_key const& key) const
    {
        return hash_value(key);
    }
};

cache_key
make_cache_key(
    cache_identity const& identity,
    cache_key_kind kind,
    string target,
    integer depth);

// Do :a and :b refer to the same target within the same cache instance?
// (i.e., Are they equal except for depth?)
bool
same_target(cache_key const& a, cache_key const& b);

// A cache_key_allocator hands out instance IDs.
// IDs are assigned per class, start at 1 and increase monotonically.
// Allocation is internally synchronized.
struct cache_key_allocator : noncopyable
{
    integer
    allocate_instance_id(string const& class_id);

    cache_identity
    allocate_identity(string const& class_id)
    {
        return cache_identity{class_id, allocate_instance_id(class_id)};
    }

 private:
    std::mutex mutex_;
    std::unordered_map<string, integer> last_ids_;
};

// Get the process-wide allocator that caches use unless they're given one
// explicitly.
cache_key_allocator&
default_cache_key_allocator();

} // namespace canopy

#endif
