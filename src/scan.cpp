#include <chrono>
#include <deque>
#include <iostream>

#include <boost/program_options.hpp>

#include <cppcoro/static_thread_pool.hpp>
#include <cppcoro/sync_wait.hpp>

#include <canopy/caching/completeness_cache.hpp>
#include <canopy/fs/filesystem_source.hpp>
#include <canopy/utilities/errors.h>
#include <canopy/utilities/logging.hpp>
#include <canopy/utilities/text.h>

using namespace canopy;

namespace {

// Parse a depth given on the command line ("complete" or a number).
integer
parse_depth(string const& text)
{
    if (text == "complete")
        return complete_depth;
    try
    {
        return lexical_cast<integer>(text);
    }
    catch (boost::bad_lexical_cast&)
    {
        CANOPY_THROW(
            parsing_error() << expected_format_info("integer or 'complete'")
                            << parsed_text_info(text));
    }
}

struct scan_totals
{
    integer nodes = 0;
    integer failures = 0;
};

// Walk the tree below :root breadth-first, requesting each directory at the
// number of levels that remain below it.
scan_totals
scan_tree(
    completeness_cache& cache,
    filesystem_source const& source,
    file_path const& root,
    integer depth)
{
    scan_totals totals;
    std::deque<std::pair<tree_node_ptr, integer>> queue;
    queue.emplace_back(source.make_node(root), depth);
    while (!queue.empty())
    {
        auto [node, remaining] = queue.front();
        queue.pop_front();
        ++totals.nodes;
        if (remaining == 0)
            continue;
        try
        {
            auto children = cppcoro::sync_wait(
                cache.get_children(*node, true, remaining));
            integer next
                = remaining == complete_depth ? complete_depth : remaining - 1;
            for (auto& child : children)
                queue.emplace_back(std::move(child), next);
        }
        catch (source_fetch_error& e)
        {
            ++totals.failures;
            get_logger()->warn(
                "unable to scan {}: {}", node->identifier(), e.what());
        }
    }
    return totals;
}

void
print_stats(cache_stats const& stats)
{
    std::cout << "cache entries:   " << stats.entries << " ("
              << stats.memory_bytes << " bytes)\n"
              << "hits / misses:   " << stats.hits << " / " << stats.misses
              << " (hit rate " << stats.hit_rate << ")\n"
              << "upgrades:        " << stats.upgrades << "\n"
              << "evictions:       " << stats.evictions << "\n"
              << "stale entries:   " << stats.stale_entries << "\n"
              << "coalesced waits: " << stats.coalesced_waits << "\n"
              << "tracked nodes:   " << stats.tracked_nodes << "\n";
}

} // namespace

int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    desc.add_options()
        ("help", "show help message")
        ("config-file", po::value<string>(), "specify the cache configuration file to use")
        ("depth", po::value<string>()->default_value("complete"), "the number of levels to scan (or 'complete')")
        ("repeat", po::value<int>()->default_value(2), "the number of times to scan the tree")
        ("log-file", po::value<string>(), "also write log messages to this file")
        ("verbose", "log cache activity")
        ("directory", po::value<string>(), "the directory to scan")
    ;
    po::positional_options_description positional;
    positional.add("directory", 1);

    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);

        if (vm.count("help") || !vm.count("directory"))
        {
            std::cout << "usage: canopy-scan [options] DIRECTORY\n" << desc;
            return vm.count("help") ? 0 : 1;
        }

        logging_config log_config;
        if (vm.count("log-file"))
            log_config.log_file = file_path(vm["log-file"].as<string>());
        if (vm.count("verbose"))
            log_config.level = spdlog::level::debug;
        initialize_logging(log_config);

        completeness_cache_config config;
        if (vm.count("config-file"))
        {
            config = read_cache_config_file(
                file_path(vm["config-file"].as<string>()));
        }

        integer depth = parse_depth(vm["depth"].as<string>());
        int repeat = vm["repeat"].as<int>();
        file_path root(vm["directory"].as<string>());

        cppcoro::static_thread_pool pool;
        auto source = std::make_shared<filesystem_source>(&pool);
        completeness_cache cache(source, config);

        for (int pass = 1; pass <= repeat; ++pass)
        {
            auto start = std::chrono::steady_clock::now();
            auto totals = scan_tree(cache, *source, root, depth);
            std::chrono::duration<double, std::milli> elapsed
                = std::chrono::steady_clock::now() - start;
            std::cout << "pass " << pass << ": " << totals.nodes << " nodes";
            if (totals.failures != 0)
                std::cout << " (" << totals.failures << " unreadable)";
            std::cout << " in " << elapsed.count() << " ms\n";
        }

        print_stats(cache.get_stats());
    }
    catch (std::exception& e)
    {
        std::cerr << "canopy-scan: " << boost::diagnostic_information(e)
                  << "\n";
        return 1;
    }
    return 0;
}
