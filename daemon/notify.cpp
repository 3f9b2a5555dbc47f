#include "daemon/notify.hpp"
#include "logger.hpp"

#include <atomic>
#include <cstring>
#include <ctime>
#include <systemd/sd-daemon.h>

static std::atomic<bool> g_enabled{true};

namespace Notify {

void setEnabled(bool enabled) {
    g_enabled.store(enabled);
}

bool enabled() {
    return g_enabled.load();
}

bool send(const std::string& state) {
    if (!g_enabled.load()) return false;

    int rc = sd_notify(0, state.c_str());
    if (rc < 0) {
        LOG_WARN("Notify", "sd_notify failed: " + std::string(std::strerror(-rc)));
        return false;
    }
    if (rc > 0) {
        LOG_DEBUG("Notify", "Sent " + state.substr(0, state.find('\n')));
    }
    return rc > 0;
}

bool starting() {
    return send("STATUS=starting");
}

bool ready() {
    return send("READY=1\nSTATUS=running voicelaunch");
}

bool reloading() {
    struct timespec ts;
    std::string state = "RELOADING=1";
    if (clock_gettime(CLOCK_MONOTONIC, &ts) == 0) {
        unsigned long long usec = static_cast<unsigned long long>(ts.tv_sec) * 1000000ULL +
                                  static_cast<unsigned long long>(ts.tv_nsec) / 1000ULL;
        state += "\nMONOTONIC_USEC=" + std::to_string(usec);
    }
    return send(state);
}

bool stopping() {
    return send("STOPPING=1");
}

} // namespace Notify
