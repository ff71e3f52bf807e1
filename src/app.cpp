#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "quota_record.hpp"
#include "result_projector.hpp"
#include "status_renderer.hpp"

namespace fs = std::filesystem;

static std::string windowLine(const UsageWindow& window, TimePoint now)
{
    if(!window.percent_used.has_value())
    {
        return "n/a";
    }
    std::string line = percentToString(window.percent_used) + "%";
    std::string countdown = timeUntil(window.resets_at, now);
    if(countdown.empty())
    {
        countdown = window.resets_in;
    }
    if(!countdown.empty())
    {
        line += std::format(", resets in {}", countdown);
    }
    if(!window.resets_at.empty())
    {
        line += std::format(" ({})", window.resets_at);
    }
    return line;
}

static std::string jsonStr(const nlohmann::json& value)
{
    return value.is_null() ? "n/a" : value.dump();
}

std::chrono::seconds chooseTtl(
    const Configuration& config, std::optional<uint32_t> explicit_ttl,
    const std::optional<fs::path>& transcript, TimePoint now)
{
    if(explicit_ttl.has_value())
    {
        return std::chrono::seconds(*explicit_ttl);
    }
    if(!transcript.has_value())
    {
        return std::chrono::seconds(config.ttl);
    }
    std::error_code ec;
    fs::file_time_type mtime = fs::last_write_time(*transcript, ec);
    if(ec)
    {
        spdlog::debug("No transcript at {}.", transcript->string());
        return std::chrono::seconds(config.idle_ttl);
    }
    auto age = now - std::chrono::file_clock::to_sys(mtime);
    if(age < std::chrono::seconds(config.activity_window))
    {
        return std::chrono::seconds(config.active_ttl);
    }
    return std::chrono::seconds(config.idle_ttl);
}

App::App(const Configuration& conf)
        : config(conf), store(conf.cache_file), lock(conf.lock_file),
          fetcher(config), refresher(fetcher, store, conf.api_url),
          coordinator(store, lock, refresher, dispatcher)
{
}

int App::get(std::chrono::seconds ttl, bool as_json)
{
    ProjectedResult result = coordinator.get(ttl);
    if(as_json)
    {
        std::cout << result.json().dump() << std::endl;
    }
    else
    {
        std::cout << result.keyValues() << std::flush;
    }
    return 0;
}

int App::render(std::chrono::seconds ttl, const std::string& tmpl)
{
    ProjectedResult result = coordinator.get(ttl);
    StatusRenderer renderer;
    auto line = renderer.render(tmpl, result);
    if(!line.has_value())
    {
        spdlog::error(line.error());
        return 1;
    }
    std::cout << *line << std::endl;
    return 0;
}

int App::refresh()
{
    auto record = refresher.runOnce();
    if(!record.has_value())
    {
        std::cerr << "Error: " << record.error() << std::endl;
        return 1;
    }
    std::cout << projectResult(*record, Clock::now()).keyValues() << std::flush;
    if(!record->valid)
    {
        std::cerr << "Fetch failed: " << record->error << std::endl;
        return 1;
    }
    return 0;
}

int App::show() const
{
    auto record = store.read();
    if(!record.has_value())
    {
        std::cout << "No quota data cached at " << store.path().string()
                  << std::endl;
        return 1;
    }

    TimePoint now = Clock::now();
    std::cout << std::format("Source:        {}\n", record->source_url);
    std::cout << std::format("Session (5h):  {}\n",
                             windowLine(record->current_session, now));
    std::cout << std::format("Weekly (7d):   {}\n",
                             windowLine(record->weekly_limits, now));
    const ExtraUsage& extra = record->extra_usage;
    if(!extra.is_enabled.is_null())
    {
        std::cout << std::format(
            "Extra usage:   enabled {}, utilization {}, credits {} of {}\n",
            jsonStr(extra.is_enabled),
            extra.utilization.has_value()
                ? percentToString(extra.utilization) + "%" : "n/a",
            jsonStr(extra.used_credits), jsonStr(extra.monthly_limit));
    }

    if(record->valid)
    {
        std::cout << "Status:        fresh\n";
    }
    else if(record->stale)
    {
        std::cout << std::format(
            "Status:        stale since {} ({} consecutive failures)\n",
            record->stale_since.value_or("unknown"),
            record->consecutive_failures);
    }
    else
    {
        std::cout << "Status:        unknown\n";
    }
    std::cout << std::format("Last attempt:  {}\n", record->attempted_at);
    if(record->last_success_at.empty())
    {
        std::cout << "Last success:  never\n";
    }
    else
    {
        std::cout << std::format("Last success:  {} ({})\n",
                                 record->last_success_at,
                                 timeSince(record->last_success_at, now));
    }
    if(!record->error.empty())
    {
        std::string code = record->api_status_code.has_value()
            ? std::format(" (HTTP {})", *record->api_status_code) : "";
        std::cout << std::format("Error:         {}{}\n", record->error, code);
    }
    auto holder = lock.holder();
    if(holder.has_value() && processAlive(*holder))
    {
        std::cout << std::format("Refreshing:    pid {}\n", *holder);
    }
    std::cout << std::flush;
    return 0;
}

int App::clear() const
{
    auto status = store.remove();
    if(!status.has_value())
    {
        std::cerr << "Error: " << status.error() << std::endl;
        return 1;
    }
    if(lock.holder().has_value() && !lock.inFlight())
    {
        lock.release();
    }
    spdlog::info("Removed {}.", store.path().string());
    return 0;
}
