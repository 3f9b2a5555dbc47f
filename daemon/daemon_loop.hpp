#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

#include "audio/frame_source.hpp"
#include "commands/dispatcher.hpp"
#include "config/config_controller.hpp"
#include "daemon/signals.hpp"
#include "scorer/scorer.hpp"
#include "wake/wake.hpp"

// Process exit codes
enum ExitCode : int {
    EXIT_OK              = 0,
    EXIT_USAGE           = 2,
    EXIT_CONFIG_INVALID  = 3,
    EXIT_STARTUP_FAILURE = 4,
    EXIT_DEVICE_FAULT    = 5
};

/// DaemonLoop
/// pull frame -> score -> detect -> dispatch -> apply pending reload.
/// Runs on one thread; the only inputs from elsewhere are ControlFlags.
class DaemonLoop {
public:
    struct Options {
        std::filesystem::path configPath;                  // re-read on reload
        std::optional<std::chrono::milliseconds> runFor;   // stop after this long
        bool keepLogLevel = false;                         // --log-level given on CLI
        std::function<Wake::Clock::time_point()> clock;    // default steady_clock::now
    };

    DaemonLoop(ConfigController& controller,
               std::unique_ptr<FrameSource> source,
               FrameSourceFactory sourceFactory,
               std::unique_ptr<Scorer> scorer,
               ScorerFactory scorerFactory,
               Dispatcher& dispatcher,
               ControlFlags& flags,
               Options options);

    // Loops until shutdown, device fault or runFor; returns the exit code
    int run();

    // One cycle. Returns false once the loop has to stop; exitCode() then
    // holds the reason.
    bool runCycle();

    int exitCode() const { return exitCode_; }
    bool sourceOpen() const { return source_ != nullptr; }
    std::uint64_t cycles() const { return cycles_; }
    const Wake::Detector& detector() const { return detector_; }

private:
    Wake::Clock::time_point now() const;
    void applyReload();

    ConfigController& controller_;
    std::unique_ptr<FrameSource> source_;
    FrameSourceFactory sourceFactory_;
    std::unique_ptr<Scorer> scorer_;
    ScorerFactory scorerFactory_;
    Dispatcher& dispatcher_;
    ControlFlags& flags_;
    Options options_;

    Wake::Detector detector_;
    Wake::Clock::time_point startedAt_{};
    bool started_ = false;
    std::uint64_t cycles_ = 0;
    int exitCode_ = EXIT_OK;
};
