#include <chrono>
#include <expected>
#include <filesystem>
#include <format>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "cache_store.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

CacheStore::CacheStore(fs::path cache_file)
        : file(std::move(cache_file))
{
}

std::optional<QuotaRecord> CacheStore::read() const
{
    if(!exists())
    {
        return std::nullopt;
    }
    auto buffer = readFile(file);
    if(!buffer.has_value())
    {
        spdlog::debug(buffer.error());
        return std::nullopt;
    }
    nlohmann::json data = nlohmann::json::parse(*buffer, nullptr, false);
    if(data.is_discarded())
    {
        spdlog::warn("Ignoring corrupt cache file {}", file.string());
        return std::nullopt;
    }
    auto record = QuotaRecord::fromJson(data);
    if(!record.has_value())
    {
        spdlog::warn("Cache file {} does not hold a record", file.string());
    }
    return record;
}

E<void> CacheStore::write(const QuotaRecord& record) const
{
    fs::path dir = file.parent_path();
    std::error_code ec;
    if(!dir.empty() && !fs::exists(dir, ec))
    {
        fs::create_directories(dir, ec);
        if(ec)
        {
            return std::unexpected(std::format(
                "Failed to create {}: {}", dir.string(), ec.message()));
        }
    }
    return replaceFile(file, record.json().dump(2) + "\n");
}

E<void> CacheStore::remove() const
{
    std::error_code ec;
    fs::remove(file, ec);
    if(ec)
    {
        return std::unexpected(std::format(
            "Failed to remove {}: {}", file.string(), ec.message()));
    }
    return {};
}

bool CacheStore::exists() const
{
    std::error_code ec;
    return fs::is_regular_file(file, ec);
}

std::optional<std::chrono::seconds> CacheStore::age(TimePoint now) const
{
    std::error_code ec;
    fs::file_time_type mtime = fs::last_write_time(file, ec);
    if(ec)
    {
        return std::nullopt;
    }
    auto written = std::chrono::file_clock::to_sys(mtime);
    return std::chrono::duration_cast<std::chrono::seconds>(now - written);
}
