#pragma once

#include <functional>
#include <string>

#include "cache_store.hpp"
#include "quota_record.hpp"
#include "time_math.hpp"
#include "usage_fetcher.hpp"
#include "utils.hpp"

using ClockFunc = std::function<TimePoint()>;

// One fetch attempt, always followed by a cache write: the fresh record on
// success, the degraded one otherwise.
class Refresher
{
public:
    Refresher() = delete;
    Refresher(UsageFetcher& usage_fetcher, const CacheStore& cache_store,
              std::string source_url, ClockFunc clock_func = Clock::now);

    // Returns the record that was written.
    E<QuotaRecord> runOnce();

private:
    UsageFetcher& fetcher;
    const CacheStore& store;
    const std::string url;
    ClockFunc clock;
};
