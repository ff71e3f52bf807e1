#include <cerrno>
#include <cstring>
#include <exception>
#include <format>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "background.hpp"

class UniqueFd
{
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    ~UniqueFd() { reset(); }

    void reset(int new_fd = -1)
    {
        if(fd_ >= 0)
        {
            ::close(fd_);
        }
        fd_ = new_fd;
    }
    int get() const { return fd_; }

private:
    int fd_ = -1;
};

static void detachStdio()
{
    int null_fd = ::open("/dev/null", O_RDWR);
    if(null_fd < 0)
    {
        return;
    }
    ::dup2(null_fd, STDIN_FILENO);
    ::dup2(null_fd, STDOUT_FILENO);
    ::dup2(null_fd, STDERR_FILENO);
    if(null_fd > STDERR_FILENO)
    {
        ::close(null_fd);
    }
}

[[noreturn]] static void runWorker(const std::function<void()>& job)
{
    detachStdio();
    int status = 0;
    try
    {
        job();
    }
    catch(const std::exception& e)
    {
        spdlog::error("Background refresh failed: {}", e.what());
        status = 1;
    }
    spdlog::default_logger()->flush();
    ::_exit(status);
}

E<pid_t> ForkDispatcher::dispatch(std::function<void()> job)
{
    int fds[2];
    if(::pipe(fds) != 0)
    {
        return std::unexpected(std::format("pipe: {}", std::strerror(errno)));
    }
    UniqueFd read_end(fds[0]);
    UniqueFd write_end(fds[1]);

    pid_t child = ::fork();
    if(child < 0)
    {
        return std::unexpected(std::format("fork: {}", std::strerror(errno)));
    }

    if(child == 0)
    {
        read_end.reset();
        ::setsid();
        pid_t worker = ::fork();
        if(worker == 0)
        {
            write_end.reset();
            runWorker(job);
        }
        // Report the worker's pid, or -1 if the second fork failed.
        ssize_t written = ::write(write_end.get(), &worker, sizeof(worker));
        ::_exit(worker > 0 && written == sizeof(worker) ? 0 : 1);
    }

    write_end.reset();
    pid_t worker = -1;
    ssize_t got = 0;
    do
    {
        got = ::read(read_end.get(), &worker, sizeof(worker));
    } while(got < 0 && errno == EINTR);

    int status = 0;
    while(::waitpid(child, &status, 0) < 0 && errno == EINTR)
    {
    }

    if(got != sizeof(worker) || worker <= 0)
    {
        return std::unexpected("Failed to start background worker");
    }
    spdlog::debug("Started background worker {}.", worker);
    return worker;
}
