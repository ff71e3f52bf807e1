#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

#include "refresh_coordinator.hpp"

RefreshCoordinator::RefreshCoordinator(
    const CacheStore& cache_store, const LockMarker& lock,
    Refresher& quota_refresher, Dispatcher& bg_dispatcher,
    ClockFunc clock_func)
        : store(cache_store), lock_marker(lock), refresher(quota_refresher),
          dispatcher(bg_dispatcher), clock(std::move(clock_func))
{
}

ProjectedResult RefreshCoordinator::get(std::chrono::seconds ttl)
{
    last_action = decide(ttl);
    switch(last_action)
    {
    case RefreshAction::NONE:
    case RefreshAction::IN_FLIGHT:
        break;
    case RefreshAction::SYNCHRONOUS:
        refreshNow();
        break;
    case RefreshAction::BACKGROUND:
        refreshInBackground();
        break;
    }
    return projectResult(store.read(), clock());
}

RefreshAction RefreshCoordinator::decide(std::chrono::seconds ttl)
{
    auto age = store.age(clock());
    if(age.has_value() && !store.read().has_value())
    {
        // An unreadable cache counts as no cache at all.
        age.reset();
    }
    if(age.has_value() && *age < ttl)
    {
        spdlog::debug("Cache is {}s old, fresh for ttl {}s.", age->count(),
                      ttl.count());
        return RefreshAction::NONE;
    }
    if(lock_marker.inFlight())
    {
        spdlog::debug("Refresh already in flight.");
        return RefreshAction::IN_FLIGHT;
    }
    if(!age.has_value())
    {
        // Nothing to show yet, so this call waits for the first fetch.
        return RefreshAction::SYNCHRONOUS;
    }
    return RefreshAction::BACKGROUND;
}

void RefreshCoordinator::refreshNow()
{
    spdlog::debug("Refreshing synchronously...");
    auto record = refresher.runOnce();
    if(!record.has_value())
    {
        spdlog::error("Refresh failed: {}", record.error());
    }
}

void RefreshCoordinator::refreshInBackground()
{
    auto pid = dispatcher.dispatch([this]()
    {
        auto record = refresher.runOnce();
        if(!record.has_value())
        {
            spdlog::error("Background refresh failed: {}", record.error());
        }
        lock_marker.release();
    });
    if(!pid.has_value())
    {
        spdlog::warn("Cannot start background refresh ({}), refreshing "
                     "synchronously.", pid.error());
        last_action = RefreshAction::SYNCHRONOUS;
        refreshNow();
        return;
    }
    auto status = lock_marker.acquire(*pid);
    if(!status.has_value())
    {
        spdlog::warn("Failed to record refresh {}: {}", *pid, status.error());
    }
}
