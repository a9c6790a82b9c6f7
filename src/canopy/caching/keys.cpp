#include <canopy/caching/keys.hpp>

#include <tuple>

#include <boost/functional/hash.hpp>

namespace canopy {

char const*
get_cache_key_kind_name(cache_key_kind kind)
{
    switch (kind)
    {
        case cache_key_kind::COMPLETENESS:
        default:
            return "completeness";
        case cache_key_kind::CHILDREN:
            return "children";
    }
}

bool
operator==(cache_identity const& a, cache_identity const& b)
{
    return a.class_id == b.class_id && a.instance_id == b.instance_id;
}
bool
operator!=(cache_identity const& a, cache_identity const& b)
{
    return !(a == b);
}

static auto
tie_key(cache_key const& key)
{
    return std::tie(
        key.class_id, key.instance_id, key.kind, key.target, key.depth);
}

bool
operator==(cache_key const& a, cache_key const& b)
{
    return tie_key(a) == tie_key(b);
}
bool
operator!=(cache_key const& a, cache_key const& b)
{
    return !(a == b);
}
bool
operator<(cache_key const& a, cache_key const& b)
{
    return tie_key(a) < tie_key(b);
}

std::ostream&
operator<<(std::ostream& s, cache_key const& key)
{
    s << "(" << key.class_id << ", " << key.instance_id << ", "
      << get_cache_key_kind_name(key.kind) << ", " << key.target << ", "
      << key.depth << ")";
    return s;
}

size_t
hash_value(cache_key const& key)
{
    size_t seed = 0;
    boost::hash_combine(seed, key.class_id);
    boost::hash_combine(seed, key.instance_id);
    boost::hash_combine(seed, static_cast<int>(key.kind));
    boost::hash_combine(seed, key.target);
    boost::hash_combine(seed, key.depth);
    return seed;
}

cache_key
make_cache_key(
    cache_identity const& identity,
    cache_key_kind kind,
    string target,
    integer depth)
{
    return cache_key{
        identity.class_id,
        identity.instance_id,
        kind,
        std::move(target),
        depth};
}

bool
same_target(cache_key const& a, cache_key const& b)
{
    return a.class_id == b.class_id && a.instance_id == b.instance_id
           && a.kind == b.kind && a.target == b.target;
}

integer
cache_key_allocator::allocate_instance_id(string const& class_id)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return ++last_ids_[class_id];
}

cache_key_allocator&
default_cache_key_allocator()
{
    static cache_key_allocator the_allocator;
    return the_allocator;
}

} // namespace canopy
