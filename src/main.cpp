#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>
#include <cxxopts.hpp>

#include "app.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "time_math.hpp"
#include "utils.hpp"

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options(
        "quotacache",
        "Cached usage quota for status lines.\n\n"
        "Commands: get (default), render, refresh, show, clear");
    cmd_options.add_options()
        ("command", "Command to run",
         cxxopts::value<std::string>()->default_value("get"))
        ("c,config", "Config file",
         cxxopts::value<std::string>()->default_value(
             std::string(DEFAULT_CONFIG_FILE)))
        ("t,ttl", "Seconds a cached reading stays fresh",
         cxxopts::value<uint32_t>())
        ("transcript", "Pick the TTL from this file's recent activity",
         cxxopts::value<std::string>())
        ("json", "Print the result as JSON")
        ("template", "Status template for render",
         cxxopts::value<std::string>())
        ("v,verbose", "Log debug messages")
        ("h,help", "Print this message.");
    cmd_options.parse_positional({"command"});
    cmd_options.positional_help("[command]");

    cxxopts::ParseResult opts;
    try
    {
        opts = cmd_options.parse(argc, argv);
    }
    catch(const cxxopts::exceptions::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    if(opts.count("help"))
    {
        std::cout << cmd_options.help() << std::endl;
        return 0;
    }

    std::string config_file = opts["config"].as<std::string>();
    Configuration config;
    std::filesystem::path config_path = expandHome(config_file);
    std::error_code ec;
    if(opts.count("config") || std::filesystem::exists(config_path, ec))
    {
        auto loaded = Configuration::fromYaml(config_path);
        if(!loaded.has_value())
        {
            std::cerr << "Error: failed to load config: " << loaded.error()
                      << std::endl;
            return 1;
        }
        config = *std::move(loaded);
    }

    auto logging = setupLogging(config, opts.count("verbose") > 0);
    if(!logging.has_value())
    {
        std::cerr << "Error: " << logging.error() << std::endl;
        return 1;
    }

    std::optional<uint32_t> ttl_arg;
    if(opts.count("ttl"))
    {
        ttl_arg = opts["ttl"].as<uint32_t>();
    }
    std::optional<std::filesystem::path> transcript;
    if(opts.count("transcript"))
    {
        transcript = opts["transcript"].as<std::string>();
    }
    std::chrono::seconds ttl = chooseTtl(config, ttl_arg, transcript,
                                         Clock::now());

    App app(config);
    const std::string command = opts["command"].as<std::string>();
    if(command == "get")
    {
        return app.get(ttl, opts.count("json") > 0);
    }
    else if(command == "render")
    {
        std::string tmpl = config.status_template;
        if(opts.count("template"))
        {
            tmpl = opts["template"].as<std::string>();
        }
        return app.render(ttl, tmpl);
    }
    else if(command == "refresh")
    {
        return app.refresh();
    }
    else if(command == "show")
    {
        return app.show();
    }
    else if(command == "clear")
    {
        return app.clear();
    }
    std::cerr << "Error: unknown command " << command << std::endl;
    return 2;
}
