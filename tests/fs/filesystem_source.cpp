#include <canopy/fs/filesystem_source.hpp>

#include <cppcoro/sync_wait.hpp>
#include <cppcoro/when_all.hpp>

#include <canopy/caching/completeness_cache.hpp>
#include <canopy/fs/file_io.h>
#include <canopy/utilities/errors.h>
#include <canopy/utilities/testing.h>

using namespace canopy;

namespace {

file_path
make_test_tree(string const& name)
{
    auto root = get_test_directory(name);
    std::filesystem::create_directories(root / "src" / "core");
    std::filesystem::create_directories(root / "docs");
    dump_string_to_file(root / "README", "hello");
    dump_string_to_file(root / "src" / "main.cpp", "int main() {}");
    return root;
}

std::vector<string>
child_names(child_list const& children)
{
    std::vector<string> names;
    for (auto const& child : children)
    {
        names.push_back(
            dynamic_cast<filesystem_node const&>(*child)
                .path()
                .filename()
                .string());
    }
    return names;
}

} // namespace

TEST_CASE("filesystem enumeration", "[fs][filesystem_source]")
{
    auto root = make_test_tree("filesystem_enumeration");
    filesystem_source source;
    auto root_node = source.make_node(root);

    auto children = cppcoro::sync_wait(source.get_children(*root_node));
    REQUIRE(
        child_names(children)
        == (std::vector<string>{"README", "docs", "src"}));

    {
        INFO("Identifiers are absolute paths with '/' separators.");
        REQUIRE(children[2]->identifier() == root_node->identifier() + "/src");
        REQUIRE(root_node->identifier().find('\\') == string::npos);
    }

    {
        INFO("Files have no children.");
        auto file_children
            = cppcoro::sync_wait(source.get_children(*children[0]));
        REQUIRE(file_children.empty());
    }

    {
        INFO("Missing directories are errors.");
        auto missing = source.make_node(root / "missing");
        try
        {
            cppcoro::sync_wait(source.get_children(*missing));
            FAIL("no exception thrown");
        }
        catch (source_fetch_error& e)
        {
            REQUIRE(
                get_required_error_info<target_info>(e)
                == missing->identifier());
            get_required_error_info<internal_error_message_info>(e);
        }
    }
}

TEST_CASE("filesystem metadata", "[fs][filesystem_source]")
{
    auto root = make_test_tree("filesystem_metadata");
    cppcoro::static_thread_pool pool(2);
    filesystem_source source(&pool);

    auto readme = source.make_node(root / "README");
    auto metadata = cppcoro::sync_wait(readme->metadata());
    REQUIRE(metadata.modified_time);
    REQUIRE(!metadata.is_directory);
    REQUIRE(metadata.size == some(integer(5)));

    auto src = cppcoro::sync_wait(source.make_node(root / "src")->metadata());
    REQUIRE(src.is_directory);

    INFO("Changing a directory's contents changes its modification time.");
    auto docs = source.make_node(root / "docs");
    double before = *cppcoro::sync_wait(docs->metadata()).modified_time;
    std::filesystem::last_write_time(
        root / "docs",
        std::filesystem::last_write_time(root / "docs")
            - std::chrono::seconds(10));
    double after = *cppcoro::sync_wait(docs->metadata()).modified_time;
    REQUIRE(after == Approx(before - 10).epsilon(0).margin(0.01));
}

TEST_CASE("caching a filesystem", "[fs][filesystem_source]")
{
    auto root = make_test_tree("caching_a_filesystem");
    cppcoro::static_thread_pool pool(2);
    auto source = std::make_shared<filesystem_source>(&pool);
    completeness_cache_config config;
    config.validation_ttl_seconds = 0;
    completeness_cache cache(source, config);

    auto root_node = source->make_node(root);
    auto first = cppcoro::sync_wait(cache.get_or_fetch(*root_node, true, 1));
    REQUIRE(first.outcome == fetch_outcome::MISS);
    REQUIRE(first.children.size() == 3);

    auto second = cppcoro::sync_wait(cache.get_or_fetch(*root_node, true, 1));
    REQUIRE(second.outcome == fetch_outcome::HIT);

    INFO("Adding a file invalidates the cached listing.");
    dump_string_to_file(root / "NEWS", "news");
    // Make sure the change is visible even on filesystems with coarse
    // timestamps.
    std::filesystem::last_write_time(
        root,
        std::filesystem::last_write_time(root) + std::chrono::seconds(5));
    auto third = cppcoro::sync_wait(cache.get_or_fetch(*root_node, true, 1));
    REQUIRE(third.outcome == fetch_outcome::MISS);
    REQUIRE(third.children.size() == 4);
}
