#include <chrono>
#include <filesystem>
#include <optional>

#include <gtest/gtest.h>

#include "app.hpp"
#include "config.hpp"
#include "test_utils.hpp"

using namespace std::chrono;

namespace
{

Configuration ttlConfig()
{
    Configuration config;
    config.ttl = 45;
    config.active_ttl = 20;
    config.idle_ttl = 400;
    config.activity_window = 300;
    return config;
}

} // namespace

TEST(ChooseTtl, ExplicitValueWins)
{
    TempDir dir;
    auto transcript = dir.path() / "session.jsonl";
    writeText(transcript, "{}\n");
    EXPECT_EQ(chooseTtl(ttlConfig(), 7u, transcript, Clock::now()),
              seconds(7));
    EXPECT_EQ(chooseTtl(ttlConfig(), 0u, std::nullopt, Clock::now()),
              seconds(0));
}

TEST(ChooseTtl, ConfiguredTtlWithoutTranscript)
{
    EXPECT_EQ(chooseTtl(ttlConfig(), std::nullopt, std::nullopt, Clock::now()),
              seconds(45));
}

TEST(ChooseTtl, RecentActivityUsesActiveTtl)
{
    TempDir dir;
    auto transcript = dir.path() / "session.jsonl";
    writeText(transcript, "{}\n");
    TimePoint now = floor<seconds>(Clock::now());
    setMtime(transcript, now - seconds(100));
    EXPECT_EQ(chooseTtl(ttlConfig(), std::nullopt, transcript, now),
              seconds(20));
}

TEST(ChooseTtl, OldTranscriptUsesIdleTtl)
{
    TempDir dir;
    auto transcript = dir.path() / "session.jsonl";
    writeText(transcript, "{}\n");
    TimePoint now = floor<seconds>(Clock::now());
    setMtime(transcript, now - seconds(300));
    EXPECT_EQ(chooseTtl(ttlConfig(), std::nullopt, transcript, now),
              seconds(400));
}

TEST(ChooseTtl, MissingTranscriptUsesIdleTtl)
{
    TempDir dir;
    EXPECT_EQ(chooseTtl(ttlConfig(), std::nullopt,
                        dir.path() / "absent.jsonl", Clock::now()),
              seconds(400));
}
