#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "quota_record.hpp"

static bool isWhole(double v)
{
    return std::floor(v) == v;
}

static std::string stringAt(const nlohmann::json& doc,
                            std::initializer_list<std::string_view> pointers)
{
    auto value = lookupFirst(doc, pointers);
    if(value.has_value() && value->is_string())
    {
        return value->get<std::string>();
    }
    return {};
}

static nlohmann::json valueAt(const nlohmann::json& doc,
                              std::string_view pointer)
{
    auto value = lookupFirst(doc, {pointer});
    if(value.has_value())
    {
        return *std::move(value);
    }
    return nullptr;
}

static std::optional<double> percentAt(
    const nlohmann::json& doc, std::initializer_list<std::string_view> pointers)
{
    auto value = lookupFirst(doc, pointers);
    if(!value.has_value())
    {
        return std::nullopt;
    }
    return normalizePercent(*value);
}

std::optional<double> normalizePercent(double value)
{
    if(!std::isfinite(value) || value < 0.0 || value > 100.0)
    {
        return std::nullopt;
    }
    double whole = std::round(value);
    if(std::fabs(value - whole) < 1e-7)
    {
        return whole;
    }
    return std::round(value * 100.0) / 100.0;
}

std::optional<double> normalizePercent(const nlohmann::json& value)
{
    if(value.is_number())
    {
        return normalizePercent(value.get<double>());
    }
    if(value.is_string())
    {
        // Older writers stored numbers as strings.
        const auto& s = value.get_ref<const std::string&>();
        double v = 0.0;
        auto status = std::from_chars(s.data(), s.data() + s.size(), v);
        if(status.ec == std::errc() && status.ptr == s.data() + s.size())
        {
            return normalizePercent(v);
        }
    }
    return std::nullopt;
}

nlohmann::json percentToJson(const std::optional<double>& pct)
{
    if(!pct.has_value())
    {
        return nullptr;
    }
    if(isWhole(*pct))
    {
        return static_cast<int64_t>(*pct);
    }
    return *pct;
}

std::string percentToString(const std::optional<double>& pct)
{
    if(!pct.has_value())
    {
        return {};
    }
    if(isWhole(*pct))
    {
        return std::format("{}", static_cast<int64_t>(*pct));
    }
    return std::format("{}", *pct);
}

std::optional<nlohmann::json> lookupFirst(
    const nlohmann::json& doc, std::initializer_list<std::string_view> pointers)
{
    for(std::string_view pointer: pointers)
    {
        nlohmann::json::json_pointer ptr{std::string(pointer)};
        if(!doc.contains(ptr))
        {
            continue;
        }
        const nlohmann::json& value = doc.at(ptr);
        if(value.is_null() || (value.is_string() && value.empty()))
        {
            continue;
        }
        return value;
    }
    return std::nullopt;
}

nlohmann::json UsageWindow::json() const
{
    return {{"percent_used", percentToJson(percent_used)},
            {"resets_at", resets_at},
            {"resets_in", resets_in}};
}

nlohmann::json ExtraUsage::json() const
{
    return {{"is_enabled", is_enabled},
            {"utilization", percentToJson(utilization)},
            {"used_credits", used_credits},
            {"monthly_limit", monthly_limit}};
}

nlohmann::json QuotaRecord::json() const
{
    nlohmann::json doc;
    doc["schema_version"] = schema_version;
    doc["source_url"] = source_url;
    doc["attempted_at_utc"] = attempted_at;
    doc["fetched_at_utc"] = fetched_at;
    doc["current_session"] = current_session.json();
    doc["weekly_limits"] = weekly_limits.json();
    doc["extra_usage"] = extra_usage.json();
    doc["quota_used_pct"] = percentToJson(current_session.percent_used);
    doc["weekly_used_pct"] = percentToJson(weekly_limits.percent_used);
    doc["resets_in"] = current_session.resets_in;
    doc["weekly_resets"] = weekly_limits.resets_in;
    doc["updated"] = updated_at;
    doc["valid"] = valid;
    doc["stale"] = stale;
    if(stale_since.has_value())
    {
        doc["stale_since"] = *stale_since;
    }
    else
    {
        doc["stale_since"] = nullptr;
    }
    doc["stale_reason"] = stale_reason;
    doc["last_success_updated"] = last_success_at;
    doc["error"] = error;
    if(api_status_code.has_value())
    {
        doc["api_status_code"] = *api_status_code;
    }
    else
    {
        doc["api_status_code"] = nullptr;
    }
    doc["consecutive_failures"] = consecutive_failures;
    return doc;
}

std::optional<QuotaRecord> QuotaRecord::fromJson(const nlohmann::json& doc)
{
    if(!doc.is_object())
    {
        return std::nullopt;
    }

    QuotaRecord record;
    auto version = lookupFirst(doc, {"/schema_version"});
    if(version.has_value() && version->is_number_integer())
    {
        record.schema_version = version->get<int>();
    }
    else
    {
        // Records without a version predate the nested layout.
        record.schema_version = 1;
    }
    record.source_url = stringAt(doc, {"/source_url"});
    record.attempted_at = stringAt(doc, {"/attempted_at_utc"});
    record.fetched_at = stringAt(doc, {"/fetched_at_utc"});
    record.updated_at = stringAt(doc, {"/updated"});
    record.last_success_at = stringAt(doc, {"/last_success_updated"});

    record.current_session.percent_used =
        percentAt(doc, {"/current_session/percent_used", "/quota_used_pct"});
    record.current_session.resets_at =
        stringAt(doc, {"/current_session/resets_at"});
    record.current_session.resets_in =
        stringAt(doc, {"/current_session/resets_in", "/resets_in"});

    record.weekly_limits.percent_used =
        percentAt(doc, {"/weekly_limits/percent_used", "/weekly_used_pct"});
    record.weekly_limits.resets_at =
        stringAt(doc, {"/weekly_limits/resets_at"});
    record.weekly_limits.resets_in =
        stringAt(doc, {"/weekly_limits/resets_in", "/weekly_resets"});

    record.extra_usage.is_enabled = valueAt(doc, "/extra_usage/is_enabled");
    record.extra_usage.utilization =
        percentAt(doc, {"/extra_usage/utilization"});
    record.extra_usage.used_credits = valueAt(doc, "/extra_usage/used_credits");
    record.extra_usage.monthly_limit =
        valueAt(doc, "/extra_usage/monthly_limit");

    auto valid = lookupFirst(doc, {"/valid"});
    record.valid = valid.has_value() && valid->is_boolean() && valid->get<bool>();
    auto stale = lookupFirst(doc, {"/stale"});
    record.stale = stale.has_value() && stale->is_boolean() && stale->get<bool>();

    auto stale_since = lookupFirst(doc, {"/stale_since"});
    if(stale_since.has_value() && stale_since->is_string())
    {
        record.stale_since = stale_since->get<std::string>();
    }
    record.stale_reason = stringAt(doc, {"/stale_reason"});
    record.error = stringAt(doc, {"/error"});

    auto code = lookupFirst(doc, {"/api_status_code"});
    if(code.has_value() && code->is_number_integer())
    {
        record.api_status_code = code->get<int>();
    }

    auto failures = lookupFirst(doc, {"/consecutive_failures"});
    if(failures.has_value() && failures->is_number_integer())
    {
        // Other writers may store anything; saturate instead of wrapping.
        uint64_t count = 0;
        if(failures->is_number_unsigned())
        {
            count = failures->get<uint64_t>();
        }
        else if(failures->get<int64_t>() > 0)
        {
            count = static_cast<uint64_t>(failures->get<int64_t>());
        }
        record.consecutive_failures = static_cast<int>(
            std::min<uint64_t>(count, std::numeric_limits<int>::max()));
    }
    return record;
}
