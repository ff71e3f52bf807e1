#include <expected>
#include <format>
#include <memory>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "logging.hpp"

E<void> setupLogging(const Configuration& config, bool verbose)
{
    std::shared_ptr<spdlog::logger> logger;
    if(config.log_file.empty())
    {
        logger = spdlog::stderr_color_mt("quotacache");
    }
    else
    {
        try
        {
            logger = spdlog::basic_logger_mt("quotacache", config.log_file);
        }
        catch(const spdlog::spdlog_ex& e)
        {
            return std::unexpected(std::format(
                "Failed to open log file {}: {}", config.log_file, e.what()));
        }
        logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%P] [%l] %v");
        logger->flush_on(spdlog::level::info);
    }
    spdlog::set_default_logger(logger);

    if(verbose)
    {
        spdlog::set_level(spdlog::level::debug);
        return {};
    }
    auto level = spdlog::level::from_str(config.log_level);
    if(level == spdlog::level::off && config.log_level != "off")
    {
        return std::unexpected(std::format("Unknown log level {}",
                                           config.log_level));
    }
    spdlog::set_level(level);
    return {};
}
