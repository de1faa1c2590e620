#include "bootstrap.hpp"
#include "resources.hpp"
#include "logger.hpp"
#include "voice/console_recognizer.hpp"
#include "voice/voice.hpp"
#include "voice/voice_speak.hpp"

#include <nlohmann/json.hpp>
#include <iostream>

#ifdef _WIN32
    #include <io.h>
    #define VOICEATC_ISATTY(fd) _isatty(fd)
    #define VOICEATC_STDIN_FD   0
#else
    #include <unistd.h>
    #define VOICEATC_ISATTY(fd) isatty(fd)
    #define VOICEATC_STDIN_FD   STDIN_FILENO
#endif

// ============================================================
// Stages
// ============================================================
static void applyLogging(const AppConfig& cfg) {
    LogLevel level = LogLevel::Info;
    if (parseLogLevel(cfg.logLevel, level)) {
        setLogLevel(level);
    }
    if (!cfg.logFile.empty() && !initLogger(cfg.logFile.string())) {
        LOG_WARN("Config", "Continuing with console logging only");
    }
}

static void loadErrorCatalog() {
    std::string text = loadTextResource("errors.json");
    if (text.empty()) {
        LOG_PHASE("Error catalog (defaults)", true);
        return;
    }

    std::string err;
    try {
        if (ErrorManager::loadFromJson(nlohmann::json::parse(text), &err)) {
            LOG_PHASE("Error catalog load", true);
            return;
        }
    } catch (const std::exception& e) {
        err = e.what();
    }
    LOG_WARN("ErrorManager", "errors.json ignored, using defaults: " + err);
    LOG_PHASE("Error catalog load", false);
}

static StageResult loadMappings(const AppConfig& cfg, Phrases::MappingTablePtr& out) {
    std::string err;
    if (!Phrases::loadMappingTable(cfg.mappingsPath.string(), out, &err)) {
        LOG_PHASE("Mappings load", false);
        return ErrorManager::report(ErrorKind::Config, "ERR_MAPPINGS_INVALID", err);
    }
    LOG_PHASE("Mappings load", true);
    return StageResult::ok();
}

static StageResult createRecognizer(const LaunchOptions& opts,
                                    const AppConfig& cfg,
                                    std::unique_ptr<Voice::Recognizer>& out) {
    if (opts.useStdin) {
        bool interactive = VOICEATC_ISATTY(VOICEATC_STDIN_FD) != 0;
        out = std::make_unique<Voice::ConsoleRecognizer>(std::cin, interactive);
        LOG_PHASE("Recognizer (console)", true);
        return StageResult::ok();
    }

    if (!opts.replayPath.empty()) {
        auto replay = std::make_unique<Voice::ConsoleRecognizer>(opts.replayPath);
        if (!replay->isOpen()) {
            LOG_PHASE("Recognizer (replay)", false);
            return ErrorManager::report(ErrorKind::Config, "ERR_REPLAY_NOT_FOUND", opts.replayPath);
        }
        out = std::move(replay);
        LOG_PHASE("Recognizer (replay)", true);
        return StageResult::ok();
    }

    auto whisper = std::make_unique<Voice::WhisperRecognizer>(cfg);
    StageResult r = whisper->open();
    if (!r) {
        LOG_PHASE("Recognizer (whisper)", false);
        return r;
    }
    out = std::move(whisper);
    LOG_PHASE("Recognizer (whisper)", true);
    return r;
}

static void createSynthesizer(const LaunchOptions& opts,
                              const AppConfig& cfg,
                              std::unique_ptr<Voice::Synthesizer>& out) {
    if (opts.dryRun) {
        out = std::make_unique<Voice::ConsoleSynthesizer>(std::cout);
        LOG_PHASE("Synthesizer (console)", true);
        return;
    }
    out = std::make_unique<Voice::TtsSynthesizer>(cfg);
    LOG_PHASE("Synthesizer (tts)", true);
}

// ============================================================
// Entry
// ============================================================
StageResult runBootstrapChecks(const LaunchOptions& opts, Runtime& out) {
    LOG_PHASE("Bootstrap begin", true);

    // ============================================================
    // Config (buffered until the log file from the config is open)
    // ============================================================
    beginPhaseGroup();
    std::string configPath = opts.configPath.empty() ? defaultConfigPath() : opts.configPath;
    AppConfig cfg;
    StageResult r = bootstrap_config::loadConfig(configPath, cfg);
    if (!r) {
        endPhaseGroup();
        return r;
    }
    if (!opts.mappingsPath.empty()) {
        cfg.mappingsPath = opts.mappingsPath;
    }
    applyLogging(cfg);
    endPhaseGroup();
    LOG_PHASE("Config initialized", true);

    // ============================================================
    // Error catalog
    // ============================================================
    loadErrorCatalog();

    // ============================================================
    // Resources + mapping table (all-or-nothing)
    // ============================================================
    r = bootstrap_config::validateResources(cfg, opts.needsMicrophone());
    if (!r) return r;

    Phrases::MappingTablePtr table;
    r = loadMappings(cfg, table);
    if (!r) return r;

    out.config = cfg;
    out.table = table;

    if (opts.checkOnly) {
        LOG_PHASE("Bootstrap complete (check only)", true);
        return StageResult::ok();
    }

    // ============================================================
    // Recognizer / synthesizer handles
    // ============================================================
    r = createRecognizer(opts, cfg, out.recognizer);
    if (!r) return r;

    createSynthesizer(opts, cfg, out.synthesizer);

    LOG_PHASE("Bootstrap complete", true);
    return StageResult::ok();
}
