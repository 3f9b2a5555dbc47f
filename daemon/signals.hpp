#pragma once
#include <atomic>

// Flags shared between the signal handlers and the daemon loop.
// Handlers only store to these; the loop polls them once per cycle.
struct ControlFlags {
    std::atomic<bool> stop{false};
    std::atomic<bool> reload{false};
};

namespace Signals {
    // SIGINT/SIGTERM -> flags.stop, SIGHUP -> flags.reload.
    // `flags` must outlive the process or a later restoreDefaults().
    // Returns false if a handler could not be installed.
    bool install(ControlFlags& flags);
    void restoreDefaults();
}
