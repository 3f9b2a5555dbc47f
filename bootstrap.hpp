#pragma once
#include <filesystem>
#include <memory>
#include <optional>

#include "audio/frame_source.hpp"
#include "config/config_controller.hpp"
#include "logger.hpp"
#include "scorer/scorer.hpp"

struct BootstrapOptions {
    std::filesystem::path configPath;
    std::optional<LogLevel> cliLogLevel;   // --log-level, wins over the file
};

// Everything the daemon loop starts with
struct Runtime {
    std::unique_ptr<ConfigController> controller;
    std::unique_ptr<Scorer> scorer;
    std::unique_ptr<FrameSource> source;
};

// Startup phases: error catalog, config (defaults written if missing), log
// level, scorer, audio source. Returns EXIT_OK with `out` filled, or the exit
// code of the phase that failed.
int runBootstrap(const BootstrapOptions& options,
                 const ScorerFactory& makeScorer,
                 const FrameSourceFactory& makeSource,
                 Runtime& out);
