#include <cerrno>
#include <charconv>
#include <format>
#include <string>
#include <system_error>
#include <utility>

#include <signal.h>

#include <spdlog/spdlog.h>

#include "lock_marker.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

bool processAlive(pid_t pid)
{
    if(pid <= 0)
    {
        return false;
    }
    // EPERM means the process exists but belongs to someone else.
    return kill(pid, 0) == 0 || errno == EPERM;
}

LockMarker::LockMarker(fs::path lock_file)
        : file(std::move(lock_file))
{
}

std::optional<pid_t> LockMarker::holder() const
{
    std::error_code ec;
    if(!fs::is_regular_file(file, ec))
    {
        return std::nullopt;
    }
    auto buffer = readFile(file);
    if(!buffer.has_value())
    {
        return std::nullopt;
    }
    std::string text(buffer->begin(), buffer->end());
    size_t end = text.find_last_not_of(" \t\r\n");
    if(end == std::string::npos)
    {
        return std::nullopt;
    }
    text.resize(end + 1);
    size_t begin = text.find_first_not_of(" \t");
    pid_t pid = 0;
    auto status = std::from_chars(text.data() + begin,
                                  text.data() + text.size(), pid);
    if(status.ec != std::errc() || status.ptr != text.data() + text.size()
       || pid <= 0)
    {
        spdlog::debug("Ignoring malformed lock file {}", file.string());
        return std::nullopt;
    }
    return pid;
}

bool LockMarker::inFlight() const
{
    auto pid = holder();
    if(!pid.has_value())
    {
        return false;
    }
    if(processAlive(*pid))
    {
        return true;
    }
    spdlog::debug("Lock holder {} is gone.", *pid);
    return false;
}

E<void> LockMarker::acquire(pid_t pid) const
{
    fs::path dir = file.parent_path();
    std::error_code ec;
    if(!dir.empty())
    {
        fs::create_directories(dir, ec);
        if(ec)
        {
            return std::unexpected(std::format(
                "Failed to create {}: {}", dir.string(), ec.message()));
        }
    }
    return replaceFile(file, std::format("{}\n", pid));
}

void LockMarker::release() const
{
    std::error_code ec;
    fs::remove(file, ec);
    if(ec)
    {
        spdlog::warn("Failed to remove lock file {}: {}", file.string(),
                     ec.message());
    }
}
