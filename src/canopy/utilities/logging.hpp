#ifndef CANOPY_UTILITIES_LOGGING_HPP
#define CANOPY_UTILITIES_LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include <canopy/fs/types.hpp>

namespace canopy {

struct logging_config
{
    // whether or not to log to stdout (defaults to true)
    optional<bool> console;

    // a file to log to (in addition to the console) - Log files are rotated
    // once they reach 256kB.
    optional<file_path> log_file;

    // the minimum level of messages that are actually logged
    // (defaults to info)
    optional<spdlog::level::level_enum> level;
};

// Create and register the "canopy" logger.
// If the logger already exists, this only updates its level.
void
initialize_logging(logging_config const& config = logging_config());

// Get the "canopy" logger, initializing it with the default config if that
// hasn't happened yet.
std::shared_ptr<spdlog::logger>
get_logger();

} // namespace canopy

#endif
