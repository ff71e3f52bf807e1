#pragma once

#include <chrono>

#include "background.hpp"
#include "cache_store.hpp"
#include "lock_marker.hpp"
#include "refresher.hpp"
#include "result_projector.hpp"
#include "time_math.hpp"

enum class RefreshAction { NONE, IN_FLIGHT, SYNCHRONOUS, BACKGROUND };

// Decides per call whether the cache can be trusted, and if not, who
// refreshes it. Never waits for a background refresh: the result is
// whatever the cache file holds when the decision is done.
class RefreshCoordinator
{
public:
    RefreshCoordinator() = delete;
    RefreshCoordinator(const CacheStore& cache_store, const LockMarker& lock,
                       Refresher& quota_refresher, Dispatcher& bg_dispatcher,
                       ClockFunc clock_func = Clock::now);

    ProjectedResult get(std::chrono::seconds ttl);

    RefreshAction lastAction() const { return last_action; }

private:
    RefreshAction decide(std::chrono::seconds ttl);
    void refreshNow();
    void refreshInBackground();

    const CacheStore& store;
    const LockMarker& lock_marker;
    Refresher& refresher;
    Dispatcher& dispatcher;
    ClockFunc clock;
    RefreshAction last_action = RefreshAction::NONE;
};
