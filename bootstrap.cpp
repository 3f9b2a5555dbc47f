#include "bootstrap.hpp"
#include "config/config_loader.hpp"
#include "daemon/daemon_loop.hpp"
#include "error_manager.hpp"
#include "faults.hpp"

int runBootstrap(const BootstrapOptions& options,
                 const ScorerFactory& makeScorer,
                 const FrameSourceFactory& makeSource,
                 Runtime& out) {
    // ============================================================
    // Bootstrap start
    // ============================================================
    LOG_PHASE("Bootstrap begin", true);

    beginPhaseGroup();
    // Optional message overrides live beside the config file
    ErrorManager::load(options.configPath.parent_path() / "errors.json");
    LOG_PHASE("Error catalog loaded", true);
    endPhaseGroup();

    // ============================================================
    // Config file
    // ============================================================
    try {
        config_loader::ensureConfig(options.configPath);
        LOG_PHASE("Config file present", true);
    } catch (const ConfigError& e) {
        LOG_PHASE("Config file present", false);
        ErrorManager::report(e.code(), e.what());
        return EXIT_STARTUP_FAILURE;
    }

    Config cfg;
    try {
        cfg = config_loader::readConfig(options.configPath);
        LOG_PHASE("Config loaded", true);
    } catch (const ConfigError& e) {
        LOG_PHASE("Config loaded", false);
        ErrorManager::report(e.code(), e.what());
        return EXIT_CONFIG_INVALID;
    }

    // ============================================================
    // Log level
    // ============================================================
    LogLevel level = LogLevel::Info;
    if (options.cliLogLevel) {
        level = *options.cliLogLevel;
    } else {
        // Already validated by the loader
        parseLogLevel(cfg.detection.logLevel, level);
    }
    setLogLevel(level);
    LOG_DEBUG("Config", "Log level " + logLevelName(level));

    // ============================================================
    // Scorer
    // ============================================================
    try {
        out.scorer = makeScorer(cfg.detection);
        requireLabels(*out.scorer, cfg.detection);
        LOG_PHASE("Scorer ready", true);
    } catch (const ScoringFault& e) {
        LOG_PHASE("Scorer ready", false);
        ErrorManager::report(e.code(), e.what());
        out.scorer.reset();
        return EXIT_STARTUP_FAILURE;
    }

    // ============================================================
    // Audio source
    // ============================================================
    try {
        out.source = makeSource(cfg.audio);
        LOG_PHASE("Audio source open", true);
    } catch (const DeviceFault& e) {
        LOG_PHASE("Audio source open", false);
        ErrorManager::report(e.code(), e.what());
        out.scorer.reset();
        return EXIT_STARTUP_FAILURE;
    }

    out.controller = std::make_unique<ConfigController>(std::move(cfg));

    // ============================================================
    // Bootstrap complete
    // ============================================================
    LOG_PHASE("Bootstrap complete", true);
    return EXIT_OK;
}
