#include <canopy/fs/filesystem_source.hpp>

#include <algorithm>
#include <chrono>

#include <canopy/utilities/errors.h>

namespace canopy {

namespace {

string
make_identifier(file_path const& path)
{
    return path.generic_string();
}

[[noreturn]] void
throw_fetch_error(file_path const& path, std::error_code const& error)
{
    CANOPY_THROW(
        source_fetch_error() << target_info(make_identifier(path))
                             << internal_error_message_info(error.message()));
}

} // namespace

filesystem_node::filesystem_node(
    file_path path, cppcoro::static_thread_pool* pool)
    : path_(std::filesystem::absolute(path).lexically_normal()), pool_(pool)
{
}

string
filesystem_node::identifier() const
{
    return make_identifier(path_);
}

node_metadata
read_filesystem_metadata(file_path const& path)
{
    std::error_code error;
    auto status = std::filesystem::status(path, error);
    if (error)
        throw_fetch_error(path, error);

    node_metadata metadata;
    metadata.is_directory = std::filesystem::is_directory(status);

    auto write_time = std::filesystem::last_write_time(path, error);
    if (error)
        throw_fetch_error(path, error);
    metadata.modified_time
        = std::chrono::duration<double>(write_time.time_since_epoch()).count();

    if (std::filesystem::is_regular_file(status))
    {
        auto size = std::filesystem::file_size(path, error);
        if (!error)
            metadata.size = integer(size);
    }
    return metadata;
}

cppcoro::task<node_metadata>
filesystem_node::metadata() const
{
    if (pool_)
        co_await pool_->schedule();
    co_return read_filesystem_metadata(path_);
}

std::shared_ptr<filesystem_node>
filesystem_source::make_node(file_path const& path) const
{
    return std::make_shared<filesystem_node>(path, pool_);
}

cppcoro::task<child_list>
filesystem_source::get_children(tree_node const& node)
{
    if (pool_)
        co_await pool_->schedule();

    file_path directory(node.identifier());
    std::error_code error;
    if (!std::filesystem::is_directory(directory, error))
    {
        if (error && error != std::errc::no_such_file_or_directory)
            throw_fetch_error(directory, error);
        if (!std::filesystem::exists(directory, error))
        {
            throw_fetch_error(
                directory,
                std::make_error_code(std::errc::no_such_file_or_directory));
        }
        co_return child_list();
    }

    std::vector<file_path> paths;
    std::filesystem::directory_iterator i(directory, error);
    if (error)
        throw_fetch_error(directory, error);
    for (; i != std::filesystem::directory_iterator(); i.increment(error))
    {
        if (error)
            throw_fetch_error(directory, error);
        paths.push_back(i->path());
    }
    if (error)
        throw_fetch_error(directory, error);
    std::sort(paths.begin(), paths.end());

    child_list children;
    children.reserve(paths.size());
    for (auto const& path : paths)
        children.push_back(make_node(path));
    co_return children;
}

} // namespace canopy
