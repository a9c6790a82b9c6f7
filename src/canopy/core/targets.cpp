#include <canopy/core/targets.hpp>

#include <boost/algorithm/string/predicate.hpp>

namespace canopy {

string
normalize_target(string const& target)
{
    string normalized;
    normalized.reserve(target.size());
    for (char c : target)
    {
        if (c == '\\')
            c = '/';
        if (c == '/' && !normalized.empty() && normalized.back() == '/')
            continue;
        normalized.push_back(c);
    }
    if (normalized.size() > 1 && normalized.back() == '/')
        normalized.pop_back();
    return normalized;
}

bool
is_root_target(string const& target)
{
    return target == "/";
}

integer
path_depth(string const& target)
{
    integer depth = 0;
    if (!target.empty() && target.front() == '/')
        ++depth;
    bool in_component = false;
    for (char c : target)
    {
        if (c == '/' || c == '\\')
        {
            in_component = false;
        }
        else if (!in_component)
        {
            in_component = true;
            ++depth;
        }
    }
    return depth;
}

bool
is_same_or_descendant(string const& candidate, string const& ancestor)
{
    if (candidate == ancestor)
        return true;
    if (is_root_target(ancestor))
        return boost::starts_with(candidate, "/");
    return candidate.size() > ancestor.size()
           && boost::starts_with(candidate, ancestor)
           && candidate[ancestor.size()] == '/';
}

} // namespace canopy
