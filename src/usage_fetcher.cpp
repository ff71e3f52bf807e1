#include <chrono>
#include <expected>
#include <format>
#include <string>
#include <utility>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "usage_fetcher.hpp"
#include "utils.hpp"

// Split "https://host[:port]/path" into the origin and the path.
static std::pair<std::string, std::string> splitUrl(const std::string& url)
{
    size_t scheme_end = url.find("://");
    size_t host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    if(path_start == std::string::npos)
    {
        return {url, "/"};
    }
    return {url.substr(0, path_start), url.substr(path_start)};
}

FetchFailure FetchFailure::credentials()
{
    return {CREDENTIALS, "Cannot read OAuth token.", std::nullopt};
}

FetchFailure FetchFailure::transport()
{
    return {TRANSPORT, "Request failed (network error or timeout).",
            std::nullopt};
}

FetchFailure FetchFailure::invalidBody()
{
    return {UPSTREAM, "API returned invalid JSON.", 200};
}

FetchFailure FetchFailure::fromStatus(int status)
{
    switch(status)
    {
    case 401:
        return {UNAUTHORIZED,
                "OAuth token rejected (HTTP 401). Re-authenticate Claude Code.",
                status};
    case 429:
        return {RATE_LIMITED, "Rate limited by API (HTTP 429).", status};
    default:
        return {UPSTREAM, std::format("API request failed (HTTP {}).", status),
                status};
    }
}

std::string_view FetchFailure::kindStr(Kind kind)
{
    switch(kind)
    {
    case CREDENTIALS:
        return "credentials";
    case UNAUTHORIZED:
        return "unauthorized";
    case RATE_LIMITED:
        return "rate-limited";
    case UPSTREAM:
        return "upstream";
    case TRANSPORT:
        return "transport";
    }
    std::unreachable();
}

E<std::string> readAccessToken(const std::filesystem::path& path)
{
    auto buffer = readFile(path);
    if(!buffer.has_value())
    {
        return std::unexpected(buffer.error());
    }
    nlohmann::json data = nlohmann::json::parse(*buffer, nullptr, false);
    if(data.is_discarded())
    {
        return std::unexpected("Invalid credentials JSON");
    }
    const nlohmann::json::json_pointer ptr("/claudeAiOauth/accessToken");
    if(!data.contains(ptr) || !data.at(ptr).is_string()
       || data.at(ptr).empty())
    {
        return std::unexpected("No access token in credentials");
    }
    return data.at(ptr).get<std::string>();
}

HttpUsageFetcher::HttpUsageFetcher(const Configuration& conf)
        : config(conf)
{
}

FetchResult HttpUsageFetcher::fetch()
{
    auto token = readAccessToken(config.credentials_file);
    if(!token.has_value())
    {
        spdlog::warn("{}: {}", config.credentials_file.string(), token.error());
        return std::unexpected(FetchFailure::credentials());
    }

    auto [origin, path] = splitUrl(config.api_url);
    httplib::Client client(origin);
    client.set_connection_timeout(config.fetch_timeout, 0);
    client.set_read_timeout(config.fetch_timeout, 0);
    client.set_write_timeout(config.fetch_timeout, 0);
    httplib::Headers headers = {
        {"Authorization", "Bearer " + *token},
        {"anthropic-beta", config.api_beta},
        {"Accept", "application/json"},
    };

    // The client timeouts bound each socket operation. The deadline bounds
    // the whole request, so a server trickling the body cannot hold us.
    const auto deadline = std::chrono::steady_clock::now()
        + std::chrono::seconds(config.fetch_timeout);
    std::string content;
    httplib::ContentReceiver receiver = [&](const char* data, size_t length)
    {
        if(std::chrono::steady_clock::now() >= deadline)
        {
            return false;
        }
        content.append(data, length);
        return true;
    };

    spdlog::debug("Fetching usage from {}...", config.api_url);
    auto res = client.Get(path, headers, receiver);
    if(!res)
    {
        spdlog::warn("Usage request failed: {}", httplib::to_string(res.error()));
        return std::unexpected(FetchFailure::transport());
    }
    if(std::chrono::steady_clock::now() >= deadline)
    {
        spdlog::warn("Usage request took longer than {}s",
                     config.fetch_timeout);
        return std::unexpected(FetchFailure::transport());
    }
    if(res->status != httplib::StatusCode::OK_200)
    {
        spdlog::warn("Usage request returned HTTP {}", res->status);
        return std::unexpected(FetchFailure::fromStatus(res->status));
    }

    nlohmann::json body = nlohmann::json::parse(content, nullptr, false);
    if(body.is_discarded() || !body.is_object())
    {
        spdlog::warn("Usage response is not a JSON object");
        return std::unexpected(FetchFailure::invalidBody());
    }
    spdlog::debug("Usage response is {}", body.dump());
    return body;
}
