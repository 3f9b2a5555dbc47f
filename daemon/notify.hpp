#pragma once
#include <string>

// ------------------------------------------------------------
// Notify: service manager readiness protocol (sd_notify).
// Every call is a no-op when disabled or when NOTIFY_SOCKET is
// unset, so the daemon runs the same outside systemd.
// ------------------------------------------------------------
namespace Notify {
    void setEnabled(bool enabled);
    bool enabled();

    // Sends `state` ("READY=1\nSTATUS=..."). Returns true when a message
    // was delivered to the service manager.
    bool send(const std::string& state);

    bool starting();                    // STATUS=starting
    bool ready();                       // READY=1 + STATUS=running voicelaunch
    bool reloading();                   // RELOADING=1 + MONOTONIC_USEC
    bool stopping();                    // STOPPING=1
}
