#ifndef CANOPY_FS_FILESYSTEM_SOURCE_HPP
#define CANOPY_FS_FILESYSTEM_SOURCE_HPP

#include <cppcoro/static_thread_pool.hpp>

#include <canopy/core/tree.hpp>
#include <canopy/fs/types.hpp>

namespace canopy {

// a file or directory on the local filesystem
struct filesystem_node : tree_node
{
    // If :pool is supplied, metadata is read on one of its threads.
    explicit filesystem_node(
        file_path path, cppcoro::static_thread_pool* pool = nullptr);

    // the absolute path, with '/' separators
    string
    identifier() const override;

    // The modification time is the last write time, in seconds since the
    // epoch of the filesystem clock.
    cppcoro::task<node_metadata>
    metadata() const override;

    file_path const&
    path() const
    {
        return path_;
    }

 private:
    file_path path_;
    cppcoro::static_thread_pool* pool_;
};

// Read the metadata for :path, synchronously. Failures are reported as
// source_fetch_error.
node_metadata
read_filesystem_metadata(file_path const& path);

// A filesystem_source enumerates the entries of local directories.
// Children are sorted by path. Nodes that aren't directories have no
// children.
struct filesystem_source : tree_source
{
    // If :pool is supplied, directories are read on its threads (and the
    // nodes it produces read their metadata there too). It must outlive the
    // source and its nodes.
    explicit filesystem_source(cppcoro::static_thread_pool* pool = nullptr)
        : pool_(pool)
    {
    }

    cppcoro::task<child_list>
    get_children(tree_node const& node) override;

    // Create the node for :path.
    std::shared_ptr<filesystem_node>
    make_node(file_path const& path) const;

 private:
    cppcoro::static_thread_pool* pool_;
};

} // namespace canopy

#endif
