#pragma once

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "quota_record.hpp"
#include "time_math.hpp"

// Record for a successful fetch. Reads the five_hour and seven_day blocks
// and the optional extra_usage block of the upstream response.
QuotaRecord buildSuccess(const nlohmann::json& response, TimePoint now,
                         std::string_view source_url);

// Record for a failed attempt. Carries the last known values of the
// previous record forward, recomputes the countdowns against now, and
// keeps stale_since across an unbroken run of failures.
QuotaRecord buildDegraded(const std::optional<QuotaRecord>& previous,
                          TimePoint now, std::string_view error_text,
                          std::optional<int> status_code,
                          std::string_view source_url);
