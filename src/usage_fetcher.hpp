#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "utils.hpp"

struct FetchFailure
{
    enum Kind { CREDENTIALS, UNAUTHORIZED, RATE_LIMITED, UPSTREAM, TRANSPORT };

    Kind kind;
    std::string reason;
    std::optional<int> status_code;

    static FetchFailure credentials();
    static FetchFailure transport();
    static FetchFailure invalidBody();
    // Map a non-200 HTTP status.
    static FetchFailure fromStatus(int status);
    static std::string_view kindStr(Kind kind);
};

using FetchResult = std::expected<nlohmann::json, FetchFailure>;

class UsageFetcher
{
public:
    virtual ~UsageFetcher() = default;
    virtual FetchResult fetch() = 0;
};

// Read claudeAiOauth.accessToken from the credentials file.
E<std::string> readAccessToken(const std::filesystem::path& path);

class HttpUsageFetcher: public UsageFetcher
{
public:
    HttpUsageFetcher() = delete;
    explicit HttpUsageFetcher(const Configuration& conf);
    ~HttpUsageFetcher() override = default;

    FetchResult fetch() override;

private:
    const Configuration& config;
};
