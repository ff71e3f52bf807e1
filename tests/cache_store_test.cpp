#include <chrono>
#include <filesystem>
#include <iterator>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "cache_store.hpp"
#include "test_utils.hpp"

using namespace std::chrono;

TEST(CacheStore, MissingFileIsNoCache)
{
    TempDir dir;
    CacheStore store(dir.path() / "quota-data.json");
    EXPECT_FALSE(store.exists());
    EXPECT_FALSE(store.read().has_value());
    EXPECT_FALSE(store.age(Clock::now()).has_value());
}

TEST(CacheStore, WriteCreatesParentDirectory)
{
    TempDir dir;
    CacheStore store(dir.path() / "nested" / "claude" / "quota-data.json");
    QuotaRecord record;
    record.source_url = "https://example.com/usage";
    record.current_session.percent_used = 68.0;
    record.valid = true;

    ASSERT_TRUE(store.write(record).has_value());
    EXPECT_TRUE(store.exists());
    // Only the record itself is left behind.
    auto entries = std::distance(
        std::filesystem::directory_iterator(store.path().parent_path()),
        std::filesystem::directory_iterator());
    EXPECT_EQ(entries, 1);

    auto loaded = store.read();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->source_url, "https://example.com/usage");
    EXPECT_EQ(loaded->current_session.percent_used, 68.0);
    EXPECT_TRUE(loaded->valid);
}

TEST(CacheStore, WriteReplacesWholeRecord)
{
    TempDir dir;
    CacheStore store(dir.path() / "quota-data.json");
    QuotaRecord first;
    first.error = "old";
    first.consecutive_failures = 3;
    ASSERT_TRUE(store.write(first).has_value());

    QuotaRecord second;
    second.valid = true;
    ASSERT_TRUE(store.write(second).has_value());

    auto loaded = store.read();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->error, "");
    EXPECT_EQ(loaded->consecutive_failures, 0);
}

TEST(CacheStore, CorruptFileIsNoCache)
{
    TempDir dir;
    CacheStore store(dir.path() / "quota-data.json");
    writeText(store.path(), "{\"valid\": tru");
    EXPECT_TRUE(store.exists());
    EXPECT_FALSE(store.read().has_value());

    writeText(store.path(), "[1, 2, 3]");
    EXPECT_FALSE(store.read().has_value());
}

TEST(CacheStore, ReadsRecordsFromOtherWriters)
{
    TempDir dir;
    CacheStore store(dir.path() / "quota-data.json");
    writeText(store.path(), R"({
  "schema_version": 2,
  "current_session": {"percent_used": 45.5, "resets_at": "", "resets_in": "2h1m"},
  "weekly_limits": {"percent_used": null, "resets_at": "", "resets_in": ""},
  "weekly_used_pct": 19,
  "stale": true,
  "stale_since": "2025-10-19T12:00:00.000Z",
  "consecutive_failures": 2
})");
    auto loaded = store.read();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->current_session.percent_used, 45.5);
    EXPECT_EQ(loaded->weekly_limits.percent_used, 19.0);
    EXPECT_TRUE(loaded->stale);
    EXPECT_EQ(loaded->stale_since, "2025-10-19T12:00:00.000Z");
    EXPECT_EQ(loaded->consecutive_failures, 2);
}

TEST(CacheStore, AgeFollowsModificationTime)
{
    TempDir dir;
    CacheStore store(dir.path() / "quota-data.json");
    ASSERT_TRUE(store.write(QuotaRecord{}).has_value());

    TimePoint now = floor<seconds>(Clock::now());
    setMtime(store.path(), now - seconds(120));
    auto age = store.age(now);
    ASSERT_TRUE(age.has_value());
    EXPECT_EQ(age->count(), 120);
}

TEST(CacheStore, RemoveDeletesFile)
{
    TempDir dir;
    CacheStore store(dir.path() / "quota-data.json");
    ASSERT_TRUE(store.write(QuotaRecord{}).has_value());
    ASSERT_TRUE(store.remove().has_value());
    EXPECT_FALSE(store.exists());
    // Removing nothing is fine.
    EXPECT_TRUE(store.remove().has_value());
}

TEST(CacheStore, ConcurrentWritersNeverCorruptRecord)
{
    TempDir dir;
    CacheStore store(dir.path() / "quota-data.json");
    constexpr int ROUNDS = 200;

    QuotaRecord large;
    large.error = std::string(200 * 1024, 'x');
    large.consecutive_failures = 7;
    QuotaRecord small;
    small.valid = true;

    pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if(child == 0)
    {
        int failures = 0;
        for(int i = 0; i < ROUNDS; i++)
        {
            if(!store.write(large).has_value())
            {
                failures++;
            }
        }
        ::_exit(failures == 0 ? 0 : 1);
    }

    int write_failures = 0;
    int bad_reads = 0;
    for(int i = 0; i < ROUNDS; i++)
    {
        if(!store.write(small).has_value())
        {
            write_failures++;
        }
        auto loaded = store.read();
        if(!loaded.has_value()
           || (loaded->valid ? !loaded->error.empty()
                             : loaded->error.size() != large.error.size()))
        {
            bad_reads++;
        }
    }
    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_EQ(write_failures, 0);
    EXPECT_EQ(bad_reads, 0);

    auto final_record = store.read();
    ASSERT_TRUE(final_record.has_value());
    auto entries = std::distance(
        std::filesystem::directory_iterator(dir.path()),
        std::filesystem::directory_iterator());
    EXPECT_EQ(entries, 1);
}
