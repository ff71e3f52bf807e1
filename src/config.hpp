#pragma once

#include <filesystem>
#include <string>

#include <stdint.h>

#include "utils.hpp"

constexpr std::string_view DEFAULT_CONFIG_FILE = "~/.claude/quota.yaml";

constexpr std::string_view DEFAULT_STATUS_TEMPLATE =
    "{% if pct != \"\" %}{{ quota_color(pct) }}5h:{{ pct }}%"
    "{% if stale == \"true\" %}⚠{% endif %}"
    "{% if resets_in != \"\" %} ↻{{ resets_in }}{% endif %}"
    "{{ color_reset }}{% endif %}";

class Configuration
{
public:
    std::filesystem::path cache_file = expandHome("~/.claude/quota-data.json");
    std::filesystem::path lock_file = expandHome("~/.claude/.quota-fetch.lock");
    std::filesystem::path credentials_file =
        expandHome("~/.claude/.credentials.json");
    std::string api_url = "https://api.anthropic.com/api/oauth/usage";
    std::string api_beta = "oauth-2025-04-20";
    uint32_t fetch_timeout = 20; // Seconds.
    uint32_t ttl = 60;
    // TTLs picked from transcript activity when --transcript is given.
    uint32_t active_ttl = 60;
    uint32_t idle_ttl = 300;
    uint32_t activity_window = 300;
    std::string status_template = std::string(DEFAULT_STATUS_TEMPLATE);
    std::string log_level = "warn";
    std::string log_file; // Empty means stderr.

    static E<Configuration> fromYaml(const std::filesystem::path& path);
};
