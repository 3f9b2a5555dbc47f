#include "daemon/daemon_loop.hpp"
#include "daemon/notify.hpp"
#include "error_manager.hpp"
#include "faults.hpp"
#include "logger.hpp"

DaemonLoop::DaemonLoop(ConfigController& controller,
                       std::unique_ptr<FrameSource> source,
                       FrameSourceFactory sourceFactory,
                       std::unique_ptr<Scorer> scorer,
                       ScorerFactory scorerFactory,
                       Dispatcher& dispatcher,
                       ControlFlags& flags,
                       Options options)
    : controller_(controller),
      source_(std::move(source)),
      sourceFactory_(std::move(sourceFactory)),
      scorer_(std::move(scorer)),
      scorerFactory_(std::move(scorerFactory)),
      dispatcher_(dispatcher),
      flags_(flags),
      options_(std::move(options)) {}

Wake::Clock::time_point DaemonLoop::now() const {
    return options_.clock ? options_.clock() : Wake::Clock::now();
}

// ---------------- Run ----------------
int DaemonLoop::run() {
    {
        ConfigPtr cfg = controller_.current();
        std::string labels;
        for (const auto& l : cfg->detection.labels()) {
            labels += labels.empty() ? l : "," + l;
        }
        LOG_INFO("Daemon", "Listening labels=" + labels +
                           " sample_rate=" + std::to_string(cfg->audio.sampleRate) +
                           " chunk_size=" + std::to_string(cfg->audio.chunkSize));
    }

    while (runCycle()) {
    }

    // Releases the audio device
    source_.reset();
    LOG_INFO("Daemon", "Loop exited code=" + std::to_string(exitCode_) +
                       " cycles=" + std::to_string(cycles_));
    return exitCode_;
}

// ---------------- One cycle ----------------
bool DaemonLoop::runCycle() {
    if (!started_) {
        startedAt_ = now();
        started_ = true;
    }

    if (flags_.stop.load()) {
        LOG_INFO("Daemon", "Shutdown requested");
        exitCode_ = EXIT_OK;
        return false;
    }
    if (options_.runFor && now() - startedAt_ >= *options_.runFor) {
        LOG_INFO("Daemon", "Run duration elapsed");
        exitCode_ = EXIT_OK;
        return false;
    }
    if (!source_) {
        // Lost during a failed audio restart
        ErrorManager::report("ERR_DEVICE_FAULT", "no audio source after reload");
        exitCode_ = EXIT_DEVICE_FAULT;
        return false;
    }

    FrameResult frame = source_->nextFrame();
    if (!frame.success) {
        ErrorManager::report(frame.errorCode.empty() ? "ERR_DEVICE_FAULT" : frame.errorCode,
                             frame.message);
        source_.reset();
        exitCode_ = EXIT_DEVICE_FAULT;
        return false;
    }

    // One snapshot for detection and dispatch of this frame
    ConfigPtr snapshot = controller_.current();

    bool scored = true;
    ScoreFrame scores;
    try {
        scores = scorer_->score(frame.pcm);
    } catch (const ScoringFault& e) {
        ErrorManager::report(e.code(), e.what(), LogLevel::Warn);
        scored = false;
    }

    if (scored) {
        std::vector<Wake::DispatchRequest> requests = detector_.step(scores, *snapshot, now());
        for (const auto& req : requests) {
            dispatcher_.dispatch(req);
        }
    }

    if (flags_.reload.exchange(false)) {
        applyReload();
    }

    ++cycles_;
    return true;
}

// ---------------- Reload ----------------
void DaemonLoop::applyReload() {
    LOG_INFO("Reload", "Reload requested, reading " + options_.configPath.string());
    Notify::reloading();

    std::unique_ptr<Scorer> nextScorer;

    auto prepare = [&](const Config& candidate, const Config& active) {
        if (candidate.modelsDiffer(active)) {
            LOG_INFO("Reload", "Model set changed, loading new scorer");
            nextScorer = scorerFactory_(candidate.detection);
            requireLabels(*nextScorer, candidate.detection);
        }
        if (!(candidate.audio == active.audio)) {
            LOG_INFO("Reload", "Audio settings changed, restarting audio source");
            source_.reset();
            try {
                source_ = sourceFactory_(candidate.audio);
            } catch (const DeviceFault&) {
                LOG_WARN("Reload", "Reopening audio source with previous settings");
                source_ = sourceFactory_(active.audio);
                throw;
            }
        }
    };

    ReloadResult result = controller_.reloadFromFile(options_.configPath, prepare);

    // Running again either way, on the new snapshot or the old one
    Notify::ready();
    if (!result.accepted) {
        return;
    }

    if (nextScorer) {
        scorer_ = std::move(nextScorer);
    }
    detector_.retainLabels(*result.active);

    LogLevel level;
    if (!options_.keepLogLevel && parseLogLevel(result.active->detection.logLevel, level)) {
        setLogLevel(level);
    }
}
