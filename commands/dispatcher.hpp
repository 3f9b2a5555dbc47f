#pragma once
#include <string>
#include <vector>

#include "wake/wake.hpp"

// ------------------------------------------------------------
// CommandResult: outcome of launching one command
// ------------------------------------------------------------
struct CommandResult {
    std::string message;    // human readable outcome
    bool success = false;   // true if the process was started
    std::string errorCode;  // error catalog code on failure
};

// ------------------------------------------------------------
// ProcessLauncher: starts argv as an independent process and
// returns without waiting for it.
// ------------------------------------------------------------
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    virtual CommandResult launch(const std::vector<std::string>& argv) = 0;
};

// fork -> setsid -> fork -> execvp. The intermediate child is reaped at
// once, the program itself is reparented to init and outlives the daemon.
// Exec errors come back over a close-on-exec pipe.
class DetachedLauncher : public ProcessLauncher {
public:
    CommandResult launch(const std::vector<std::string>& argv) override;
};

// ------------------------------------------------------------
// Dispatcher: runs every command of a request, in order.
// A failing command is reported and never stops the others.
// ------------------------------------------------------------
class Dispatcher {
public:
    explicit Dispatcher(ProcessLauncher& launcher) : launcher_(launcher) {}

    std::vector<CommandResult> dispatch(const Wake::DispatchRequest& request);

private:
    ProcessLauncher& launcher_;
};
