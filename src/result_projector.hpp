#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "quota_record.hpp"
#include "time_math.hpp"

// What the status line sees. Everything is a string; unknown values are
// empty and the flags are "true" or "false".
struct ProjectedResult
{
    std::string pct;
    std::string weekly_pct;
    std::string resets_in;
    std::string weekly_resets_in;
    std::string stale = "false";
    std::string valid = "false";

    bool operator==(const ProjectedResult&) const = default;

    nlohmann::json json() const;
    // One key=value per line.
    std::string keyValues() const;
};

// Countdowns of a stale record are recomputed against now, so that time
// spent in an outage shows up.
ProjectedResult projectResult(const std::optional<QuotaRecord>& record,
                              TimePoint now);
