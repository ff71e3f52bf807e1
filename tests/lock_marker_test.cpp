#include <filesystem>

#include <unistd.h>

#include <gtest/gtest.h>

#include "lock_marker.hpp"
#include "test_utils.hpp"

namespace
{

// Above any pid_max Linux allows.
constexpr pid_t DEAD_PID = 999999999;

} // namespace

TEST(ProcessAlive, ChecksLiveness)
{
    EXPECT_TRUE(processAlive(::getpid()));
    EXPECT_FALSE(processAlive(DEAD_PID));
    EXPECT_FALSE(processAlive(0));
    EXPECT_FALSE(processAlive(-1));
}

TEST(LockMarker, AbsentMeansNoRefresh)
{
    TempDir dir;
    LockMarker lock(dir.path() / ".quota-fetch.lock");
    EXPECT_FALSE(lock.holder().has_value());
    EXPECT_FALSE(lock.inFlight());
}

TEST(LockMarker, LiveHolderIsInFlight)
{
    TempDir dir;
    LockMarker lock(dir.path() / ".quota-fetch.lock");
    ASSERT_TRUE(lock.acquire(::getpid()).has_value());
    EXPECT_EQ(lock.holder(), ::getpid());
    EXPECT_TRUE(lock.inFlight());

    lock.release();
    EXPECT_FALSE(std::filesystem::exists(lock.path()));
    EXPECT_FALSE(lock.inFlight());
}

TEST(LockMarker, DeadHolderIsIgnored)
{
    TempDir dir;
    LockMarker lock(dir.path() / ".quota-fetch.lock");
    ASSERT_TRUE(lock.acquire(DEAD_PID).has_value());
    EXPECT_EQ(lock.holder(), DEAD_PID);
    EXPECT_FALSE(lock.inFlight());
}

TEST(LockMarker, ParsesPidWithSurroundingWhitespace)
{
    TempDir dir;
    LockMarker lock(dir.path() / ".quota-fetch.lock");
    writeText(lock.path(), "  4242\n");
    EXPECT_EQ(lock.holder(), 4242);
}

TEST(LockMarker, MalformedContentIsIgnored)
{
    TempDir dir;
    LockMarker lock(dir.path() / ".quota-fetch.lock");
    for(const char* text: {"", "\n", "abc", "12abc", "0", "-5"})
    {
        writeText(lock.path(), text);
        EXPECT_FALSE(lock.holder().has_value()) << "content: " << text;
        EXPECT_FALSE(lock.inFlight()) << "content: " << text;
    }
}

TEST(LockMarker, ReleaseWithoutFileIsHarmless)
{
    TempDir dir;
    LockMarker lock(dir.path() / "sub" / ".quota-fetch.lock");
    lock.release();
    ASSERT_TRUE(lock.acquire(::getpid()).has_value());
    EXPECT_TRUE(std::filesystem::exists(lock.path()));
}
