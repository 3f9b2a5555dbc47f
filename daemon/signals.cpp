#include "daemon/signals.hpp"
#include "logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

static_assert(std::atomic<bool>::is_always_lock_free,
              "signal handlers need lock-free atomics");

static ControlFlags* g_flags = nullptr;

extern "C" void voicelaunchSignalHandler(int signum) {
    if (!g_flags) return;
    if (signum == SIGHUP) {
        g_flags->reload.store(true);
    } else {
        g_flags->stop.store(true);
    }
}

namespace Signals {

bool install(ControlFlags& flags) {
    g_flags = &flags;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = voicelaunchSignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    bool ok = true;
    for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
        if (sigaction(sig, &sa, nullptr) != 0) {
            LOG_ERROR("Signals", std::string("sigaction failed for ") + strsignal(sig) +
                                 ": " + std::strerror(errno));
            ok = false;
        }
    }
    return ok;
}

void restoreDefaults() {
    for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
        std::signal(sig, SIG_DFL);
    }
    g_flags = nullptr;
}

} // namespace Signals
