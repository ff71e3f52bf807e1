#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

constexpr int QUOTA_SCHEMA_VERSION = 2;

// Null for anything outside [0, 100]. Whole numbers (within 1e-7) come
// back exact, everything else is rounded to two decimals.
std::optional<double> normalizePercent(double value);
std::optional<double> normalizePercent(const nlohmann::json& value);

nlohmann::json percentToJson(const std::optional<double>& pct);
// "68", "31.46", or empty for null.
std::string percentToString(const std::optional<double>& pct);

// Return the first value found at one of the JSON pointers, skipping
// missing keys, nulls, and empty strings.
std::optional<nlohmann::json> lookupFirst(
    const nlohmann::json& doc, std::initializer_list<std::string_view> pointers);

struct UsageWindow
{
    std::optional<double> percent_used;
    std::string resets_at;
    std::string resets_in;

    nlohmann::json json() const;
};

// Passed through from upstream as is, apart from utilization which is
// normalized like the other percentages.
struct ExtraUsage
{
    nlohmann::json is_enabled;
    std::optional<double> utilization;
    nlohmann::json used_credits;
    nlohmann::json monthly_limit;

    nlohmann::json json() const;
};

struct QuotaRecord
{
    int schema_version = QUOTA_SCHEMA_VERSION;
    std::string source_url;
    std::string attempted_at;
    std::string fetched_at;
    std::string updated_at;
    std::string last_success_at;

    UsageWindow current_session;
    UsageWindow weekly_limits;
    ExtraUsage extra_usage;

    bool valid = false;
    bool stale = false;
    std::optional<std::string> stale_since;
    std::string stale_reason;
    std::string error;
    std::optional<int> api_status_code;
    int consecutive_failures = 0;

    // Schema version 2, nested blocks plus the flat legacy fields.
    nlohmann::json json() const;

    // Decode either schema generation. Nested fields win over the flat
    // legacy ones. Returns nullopt if the document is not an object.
    static std::optional<QuotaRecord> fromJson(const nlohmann::json& doc);
};
