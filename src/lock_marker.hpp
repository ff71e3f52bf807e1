#pragma once

#include <filesystem>
#include <optional>

#include <sys/types.h>

#include "utils.hpp"

// True if a process with this pid exists. Non-positive pids are never
// alive.
bool processAlive(pid_t pid);

// Advisory single-flight marker: a file holding the pid of the process
// doing the refresh. The check and the write are not atomic, so two
// callers racing through a stale window may both refresh.
class LockMarker
{
public:
    LockMarker() = delete;
    explicit LockMarker(std::filesystem::path lock_file);

    // The recorded pid, if the file exists and holds one.
    std::optional<pid_t> holder() const;
    // A refresh is in flight if the recorded process is still alive.
    bool inFlight() const;

    E<void> acquire(pid_t pid) const;
    void release() const;

    const std::filesystem::path& path() const { return file; }

private:
    std::filesystem::path file;
};
