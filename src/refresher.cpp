#include <expected>
#include <utility>

#include <spdlog/spdlog.h>

#include "payload_builder.hpp"
#include "refresher.hpp"

Refresher::Refresher(UsageFetcher& usage_fetcher, const CacheStore& cache_store,
                     std::string source_url, ClockFunc clock_func)
        : fetcher(usage_fetcher), store(cache_store),
          url(std::move(source_url)), clock(std::move(clock_func))
{
}

E<QuotaRecord> Refresher::runOnce()
{
    TimePoint now = clock();
    FetchResult response = fetcher.fetch();
    QuotaRecord record;
    if(response.has_value())
    {
        record = buildSuccess(*response, now, url);
        spdlog::info("Usage refreshed: session {}%, weekly {}%",
                     percentToString(record.current_session.percent_used),
                     percentToString(record.weekly_limits.percent_used));
    }
    else
    {
        const FetchFailure& failure = response.error();
        record = buildDegraded(store.read(), now, failure.reason,
                               failure.status_code, url);
        spdlog::warn("Usage refresh failed ({}): {} Serving stale data, "
                     "{} consecutive failures.",
                     FetchFailure::kindStr(failure.kind), failure.reason,
                     record.consecutive_failures);
    }

    auto status = store.write(record);
    if(!status.has_value())
    {
        spdlog::error("Failed to write cache: {}", status.error());
        return std::unexpected(status.error());
    }
    return record;
}
