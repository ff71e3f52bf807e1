#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <stdint.h>

#include "background.hpp"
#include "cache_store.hpp"
#include "config.hpp"
#include "lock_marker.hpp"
#include "refresh_coordinator.hpp"
#include "refresher.hpp"
#include "time_math.hpp"
#include "usage_fetcher.hpp"

// An explicit TTL wins. Otherwise, with a transcript, recent activity
// picks the active TTL and anything older (or a missing file) the idle
// one.
std::chrono::seconds chooseTtl(
    const Configuration& config, std::optional<uint32_t> explicit_ttl,
    const std::optional<std::filesystem::path>& transcript, TimePoint now);

class App
{
public:
    App() = delete;
    explicit App(const Configuration& conf);

    int get(std::chrono::seconds ttl, bool as_json);
    int render(std::chrono::seconds ttl, const std::string& tmpl);
    int refresh();
    int show() const;
    int clear() const;

private:
    const Configuration config;
    CacheStore store;
    LockMarker lock;
    HttpUsageFetcher fetcher;
    Refresher refresher;
    ForkDispatcher dispatcher;
    RefreshCoordinator coordinator;
};
