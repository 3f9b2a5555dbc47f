#include "audio/audio_devices.hpp"
#include "audio/portaudio_source.hpp"
#include "bootstrap.hpp"
#include "commands/dispatcher.hpp"
#include "config/config_loader.hpp"
#include "daemon/daemon_loop.hpp"
#include "daemon/notify.hpp"
#include "daemon/signals.hpp"
#include "faults.hpp"
#include "logger.hpp"
#include "scorer/openwakeword_scorer.hpp"

#include <chrono>
#include <iostream>
#include <string>

static void printUsage(std::ostream& out) {
    out << "Usage: voicelaunch [options]\n"
           "\n"
           "  -c, --config PATH     config file (default: "
        << config_loader::defaultConfigPath().string() << ")\n"
           "      --log-level LVL   DEBUG, INFO, WARNING, ERROR or CRITICAL\n"
           "      --log-file PATH   also append log lines to PATH\n"
           "      --once            listen for about one second, then exit\n"
           "      --list-devices    print audio input devices and exit\n"
           "      --no-notify       do not report state to the service manager\n"
           "  -h, --help            show this help\n"
           "\n"
           "Send SIGHUP to reload the config file.\n";
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    BootstrapOptions options;
    options.configPath = config_loader::defaultConfigPath();
    std::string logFile;
    bool once = false;
    bool listDevices = false;
    bool notify = true;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto needValue = [&](std::string& value) {
            if (i + 1 >= argc) {
                std::cerr << "voicelaunch: " << arg << " needs a value\n";
                return false;
            }
            value = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(std::cout);
            return EXIT_OK;
        } else if (arg == "-c" || arg == "--config") {
            std::string path;
            if (!needValue(path)) return EXIT_USAGE;
            options.configPath = config_loader::expandUser(path);
        } else if (arg == "--log-level") {
            std::string name;
            if (!needValue(name)) return EXIT_USAGE;
            LogLevel level;
            if (!parseLogLevel(name, level)) {
                std::cerr << "voicelaunch: unknown log level '" << name << "'\n";
                return EXIT_USAGE;
            }
            options.cliLogLevel = level;
        } else if (arg == "--log-file") {
            if (!needValue(logFile)) return EXIT_USAGE;
        } else if (arg == "--once") {
            once = true;
        } else if (arg == "--list-devices") {
            listDevices = true;
        } else if (arg == "--no-notify") {
            notify = false;
        } else {
            std::cerr << "voicelaunch: unknown option '" << arg << "'\n";
            printUsage(std::cerr);
            return EXIT_USAGE;
        }
    }

    if (listDevices) {
        try {
            printInputDevices(std::cout, listInputDevices());
            return EXIT_OK;
        } catch (const DeviceFault& e) {
            std::cerr << "voicelaunch: " << e.what() << "\n";
            return EXIT_STARTUP_FAILURE;
        }
    }

    if (options.cliLogLevel) {
        setLogLevel(*options.cliLogLevel);
    }
    if (!logFile.empty() && !initLogger(logFile)) {
        return EXIT_STARTUP_FAILURE;
    }
    LOG_PHASE("Startup begin", true);

    Notify::setEnabled(notify);
    Notify::starting();

    // Handlers go in before any device is opened
    ControlFlags flags;
    if (!Signals::install(flags)) {
        LOG_PHASE("Signal handlers", false);
        Notify::stopping();
        shutdownLogger();
        return EXIT_STARTUP_FAILURE;
    }
    LOG_PHASE("Signal handlers", true);

    Runtime runtime;
    int code = runBootstrap(options, makeOpenWakeWordScorer, makePortAudioSource, runtime);
    if (code != EXIT_OK) {
        LOG_PHASE("Startup aborted", false);
        Notify::stopping();
        shutdownLogger();
        return code;
    }
    Notify::ready();

    DetachedLauncher launcher;
    Dispatcher dispatcher(launcher);

    DaemonLoop::Options loopOptions;
    loopOptions.configPath = options.configPath;
    loopOptions.keepLogLevel = options.cliLogLevel.has_value();
    if (once) {
        loopOptions.runFor = std::chrono::seconds(1);
    }

    DaemonLoop loop(*runtime.controller,
                    std::move(runtime.source), makePortAudioSource,
                    std::move(runtime.scorer), makeOpenWakeWordScorer,
                    dispatcher, flags, loopOptions);
    code = loop.run();
    Notify::stopping();

    Signals::restoreDefaults();
    LOG_PHASE("Shutdown complete", true);
    shutdownLogger();
    return code;
}
