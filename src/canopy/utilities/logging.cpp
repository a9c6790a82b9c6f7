#include <canopy/utilities/logging.hpp>

#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#ifdef _WIN32
#include <spdlog/sinks/wincolor_sink.h>
#else
#include <spdlog/sinks/ansicolor_sink.h>
#endif

namespace canopy {

static std::mutex logger_creation_mutex;

void
initialize_logging(logging_config const& config)
{
    std::scoped_lock<std::mutex> lock(logger_creation_mutex);

    auto level = config.level ? *config.level : spdlog::level::info;

    if (auto existing = spdlog::get("canopy"))
    {
        existing->set_level(level);
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (!config.console || *config.console)
    {
#ifdef _WIN32
        sinks.push_back(
            std::make_shared<spdlog::sinks::wincolor_stdout_sink_mt>());
#else
        sinks.push_back(
            std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
#endif
    }
    if (config.log_file)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file->string(), 262144, 2));
    }
    auto combined_logger
        = std::make_shared<spdlog::logger>("canopy", begin(sinks), end(sinks));
    combined_logger->set_level(level);
    spdlog::register_logger(combined_logger);
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto logger = spdlog::get("canopy");
    if (logger)
        return logger;
    initialize_logging();
    return spdlog::get("canopy");
}

} // namespace canopy
