#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include <unistd.h>

#include <gtest/gtest.h>

#include "background.hpp"
#include "test_utils.hpp"

using namespace std::chrono;

namespace
{

// Wait for a file another process writes.
bool waitForFile(const std::filesystem::path& path, milliseconds timeout)
{
    auto deadline = steady_clock::now() + timeout;
    while(steady_clock::now() < deadline)
    {
        if(std::filesystem::exists(path))
        {
            return true;
        }
        std::this_thread::sleep_for(milliseconds(20));
    }
    return std::filesystem::exists(path);
}

} // namespace

TEST(ForkDispatcher, RunsJobInDetachedWorker)
{
    TempDir dir;
    const auto out = dir.path() / "worker.pid";
    const auto tmp = dir.path() / "worker.pid.tmp";

    ForkDispatcher dispatcher;
    auto pid = dispatcher.dispatch([&]()
    {
        {
            std::ofstream f(tmp);
            f << ::getpid() << " " << ::getsid(0) << "\n";
        }
        std::filesystem::rename(tmp, out);
    });
    ASSERT_TRUE(pid.has_value()) << pid.error();
    EXPECT_GT(*pid, 0);
    EXPECT_NE(*pid, ::getpid());

    ASSERT_TRUE(waitForFile(out, seconds(5)));
    std::ifstream f(out);
    pid_t worker_pid = 0;
    pid_t worker_sid = 0;
    f >> worker_pid >> worker_sid;
    EXPECT_EQ(worker_pid, *pid);
    // The worker lives in a session of its own.
    EXPECT_NE(worker_sid, ::getsid(0));
}

TEST(ForkDispatcher, CallerContinuesWhileJobRuns)
{
    TempDir dir;
    const auto out = dir.path() / "done";

    ForkDispatcher dispatcher;
    auto start = steady_clock::now();
    auto pid = dispatcher.dispatch([&]()
    {
        std::this_thread::sleep_for(milliseconds(500));
        std::ofstream f(out);
        f << "done\n";
    });
    ASSERT_TRUE(pid.has_value()) << pid.error();
    EXPECT_LT(steady_clock::now() - start, milliseconds(400));
    EXPECT_FALSE(std::filesystem::exists(out));
    EXPECT_TRUE(waitForFile(out, seconds(5)));
}
