#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "payload_builder.hpp"
#include "quota_record.hpp"
#include "time_math.hpp"

// Upstream timestamps come with arbitrary precision and offsets. Store the
// canonical UTC form when they parse, the raw text otherwise.
static std::string canonicalTimestamp(const nlohmann::json& response,
                                      std::string_view pointer)
{
    auto value = lookupFirst(response, {pointer});
    if(!value.has_value() || !value->is_string())
    {
        return {};
    }
    const auto& raw = value->get_ref<const std::string&>();
    auto tp = parseIso8601(raw);
    if(!tp.has_value())
    {
        spdlog::warn("Unrecognized reset timestamp {}", raw);
        return raw;
    }
    return formatIso8601(*tp);
}

static UsageWindow windowFrom(const nlohmann::json& response,
                              std::string_view block, TimePoint now)
{
    std::string base = std::string("/") + std::string(block);
    UsageWindow window;
    auto pct = lookupFirst(response, {base + "/utilization"});
    if(pct.has_value())
    {
        window.percent_used = normalizePercent(*pct);
    }
    window.resets_at = canonicalTimestamp(response, base + "/resets_at");
    window.resets_in = timeUntil(window.resets_at, now);
    return window;
}

static nlohmann::json passthrough(const nlohmann::json& response,
                                  std::string_view pointer)
{
    auto value = lookupFirst(response, {pointer});
    return value.has_value() ? *value : nlohmann::json();
}

static void recomputeCountdown(UsageWindow& window, TimePoint now)
{
    if(window.resets_at.empty())
    {
        return;
    }
    std::string recomputed = timeUntil(window.resets_at, now);
    if(!recomputed.empty())
    {
        window.resets_in = std::move(recomputed);
    }
}

QuotaRecord buildSuccess(const nlohmann::json& response, TimePoint now,
                         std::string_view source_url)
{
    const std::string ts = formatIso8601(now);
    QuotaRecord record;
    record.source_url = source_url;
    record.attempted_at = ts;
    record.fetched_at = ts;
    record.updated_at = ts;
    record.last_success_at = ts;

    record.current_session = windowFrom(response, "five_hour", now);
    record.weekly_limits = windowFrom(response, "seven_day", now);

    record.extra_usage.is_enabled =
        passthrough(response, "/extra_usage/is_enabled");
    auto extra_pct = lookupFirst(response, {"/extra_usage/utilization"});
    if(extra_pct.has_value())
    {
        record.extra_usage.utilization = normalizePercent(*extra_pct);
    }
    record.extra_usage.used_credits =
        passthrough(response, "/extra_usage/used_credits");
    record.extra_usage.monthly_limit =
        passthrough(response, "/extra_usage/monthly_limit");

    record.valid = true;
    record.stale = false;
    record.stale_since = std::nullopt;
    record.api_status_code = 200;
    record.consecutive_failures = 0;
    return record;
}

QuotaRecord buildDegraded(const std::optional<QuotaRecord>& previous,
                          TimePoint now, std::string_view error_text,
                          std::optional<int> status_code,
                          std::string_view source_url)
{
    const std::string ts = formatIso8601(now);
    QuotaRecord record;
    record.source_url = source_url;
    record.stale_since = ts;

    if(previous.has_value())
    {
        const QuotaRecord& prev = *previous;
        record.current_session = prev.current_session;
        record.weekly_limits = prev.weekly_limits;
        record.extra_usage = prev.extra_usage;
        if(!prev.source_url.empty())
        {
            record.source_url = prev.source_url;
        }
        record.fetched_at = prev.fetched_at;

        record.last_success_at = prev.last_success_at;
        if(record.last_success_at.empty() && prev.valid)
        {
            record.last_success_at = prev.updated_at;
        }
        if(record.last_success_at.empty())
        {
            record.last_success_at = prev.fetched_at;
        }

        if(prev.stale && prev.stale_since.has_value()
           && !prev.stale_since->empty())
        {
            record.stale_since = prev.stale_since;
        }
        record.consecutive_failures = prev.consecutive_failures;
    }

    recomputeCountdown(record.current_session, now);
    recomputeCountdown(record.weekly_limits, now);

    record.attempted_at = ts;
    record.updated_at = ts;
    record.valid = false;
    record.stale = true;
    record.stale_reason = error_text;
    record.error = error_text;
    record.api_status_code = status_code;
    if(record.consecutive_failures < std::numeric_limits<int>::max())
    {
        record.consecutive_failures++;
    }
    return record;
}
