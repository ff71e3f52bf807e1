#include <format>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "result_projector.hpp"

static std::string currentCountdown(const UsageWindow& window, bool stale,
                                    TimePoint now)
{
    if(stale && !window.resets_at.empty())
    {
        std::string recomputed = timeUntil(window.resets_at, now);
        if(!recomputed.empty())
        {
            return recomputed;
        }
    }
    return window.resets_in;
}

nlohmann::json ProjectedResult::json() const
{
    return {{"pct", pct},
            {"weekly_pct", weekly_pct},
            {"resets_in", resets_in},
            {"weekly_resets_in", weekly_resets_in},
            {"stale", stale},
            {"valid", valid}};
}

std::string ProjectedResult::keyValues() const
{
    return std::format("pct={}\nweekly_pct={}\nresets_in={}\n"
                       "weekly_resets_in={}\nstale={}\nvalid={}\n",
                       pct, weekly_pct, resets_in, weekly_resets_in, stale,
                       valid);
}

ProjectedResult projectResult(const std::optional<QuotaRecord>& record,
                              TimePoint now)
{
    ProjectedResult result;
    if(!record.has_value())
    {
        return result;
    }
    result.pct = percentToString(record->current_session.percent_used);
    result.weekly_pct = percentToString(record->weekly_limits.percent_used);
    result.resets_in = currentCountdown(record->current_session,
                                        record->stale, now);
    result.weekly_resets_in = currentCountdown(record->weekly_limits,
                                               record->stale, now);
    result.stale = record->stale ? "true" : "false";
    result.valid = record->valid ? "true" : "false";
    return result;
}
