#pragma once

#include <functional>

#include <sys/types.h>

#include "utils.hpp"

// Starts work that outlives the call. Returns the pid of the worker.
class Dispatcher
{
public:
    virtual ~Dispatcher() = default;
    virtual E<pid_t> dispatch(std::function<void()> job) = 0;
};

// Runs the job in a detached grandchild process: its own session, stdio
// on /dev/null, reparented to init so it never lingers as a zombie of the
// caller. Nobody waits for it.
class ForkDispatcher: public Dispatcher
{
public:
    ~ForkDispatcher() override = default;
    E<pid_t> dispatch(std::function<void()> job) override;
};
