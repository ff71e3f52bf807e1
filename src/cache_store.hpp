#pragma once

#include <chrono>
#include <filesystem>
#include <optional>

#include "quota_record.hpp"
#include "time_math.hpp"
#include "utils.hpp"

// The single cached QuotaRecord on disk. Every write replaces the whole
// file.
class CacheStore
{
public:
    CacheStore() = delete;
    explicit CacheStore(std::filesystem::path cache_file);

    // A missing or unparsable file reads as no cache.
    std::optional<QuotaRecord> read() const;
    E<void> write(const QuotaRecord& record) const;
    E<void> remove() const;
    bool exists() const;

    // Time since the last write, from the file's mtime. Nullopt if there
    // is no cache file.
    std::optional<std::chrono::seconds> age(TimePoint now) const;

    const std::filesystem::path& path() const { return file; }

private:
    std::filesystem::path file;
};
