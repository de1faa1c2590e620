#include "bootstrap_config.hpp"
#include "logger.hpp"

#include <cctype>
#include <fstream>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
static bool isBlank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

static fs::path resolveAgainst(const fs::path& baseDir, const std::string& value) {
    if (value.empty()) return {};
    fs::path p(value);
    return p.is_absolute() ? p : (baseDir / p).lexically_normal();
}

// nlohmann types int and unsigned differently; treat any number as a number
static bool sameKind(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_number() && b.is_number()) return true;
    return a.type() == b.type();
}

namespace bootstrap_config {

// ----------------- defaults -----------------
nlohmann::json defaultConfig() {
    return {
        {"whisper", {
            {"language", "en"},
            {"threads", 4},
            {"min_speech_ms", 500},
            {"min_silence_ms", 1200},
            {"max_segment_ms", 15000}
        }},

        {"audio", {
            {"input_device_index", -1},
            {"sample_rate", 16000},
            {"frames_per_buffer", 4096},
            {"silence_threshold", 0.02}
        }},

        {"voice", {
            {"tts_voice", "en-us"},
            {"tts_command", "espeak-ng --stdin -v {voice} -w {out}"},
            {"output_dir", "tts_out"}
        }},

        {"mappings_path", "phrase_mappings.json"},

        {"logging", {
            {"file", "voiceatc.log"},
            {"level", "info"},
            {"audit_log", ""}
        }}
    };
}

bool mergeDefaults(nlohmann::json& cfg,
                   const nlohmann::json& defs,
                   const std::string& prefix,
                   std::vector<std::string>* patchedKeys) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        std::string dotted = prefix.empty() ? key : prefix + "." + key;
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedKeys) patchedKeys->push_back(dotted);
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, dotted, patchedKeys))
                patched = true;
        } else if (!sameKind(cfg[key], defVal)) {
            LOG_WARN("Config", dotted + " has the wrong type, using default " + defVal.dump());
            cfg[key] = defVal;
            patched = true;
            if (patchedKeys) patchedKeys->push_back(dotted);
        }
    }
    return patched;
}

// ----------------- parse -----------------
StageResult parseConfig(const nlohmann::json& doc,
                        const fs::path& baseDir,
                        AppConfig& out) {
    if (!doc.is_object()) {
        return ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_PARSE",
                                    "top level must be a JSON object");
    }

    // Required: checked before defaults so a typo is never papered over
    if (!doc.contains("whisper") || !doc["whisper"].is_object() ||
        !doc["whisper"].contains("model_path") ||
        !doc["whisper"]["model_path"].is_string() ||
        isBlank(doc["whisper"]["model_path"].get<std::string>())) {
        return ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_MISSING_FIELD",
                                    "whisper.model_path");
    }

    nlohmann::json cfg = doc;
    std::vector<std::string> patched;
    if (mergeDefaults(cfg, defaultConfig(), "", &patched)) {
        std::string keys;
        for (const auto& k : patched) keys += (keys.empty() ? "" : ", ") + k;
        LOG_DEBUG("Config", "Defaults used for " + std::to_string(patched.size()) + " keys: " + keys);
    }

    AppConfig c;
    try {
        const auto& w = cfg["whisper"];
        c.modelPath       = resolveAgainst(baseDir, w["model_path"].get<std::string>());
        c.whisperLanguage = w["language"].get<std::string>();
        c.whisperThreads  = w["threads"].get<int>();
        c.minSpeechMs     = w["min_speech_ms"].get<int>();
        c.minSilenceMs    = w["min_silence_ms"].get<int>();
        c.maxSegmentMs    = w["max_segment_ms"].get<int>();

        const auto& a = cfg["audio"];
        c.inputDeviceIndex = a["input_device_index"].get<int>();
        c.sampleRate       = a["sample_rate"].get<int>();
        c.framesPerBuffer  = a["frames_per_buffer"].get<int>();
        c.silenceThreshold = a["silence_threshold"].get<double>();

        const auto& v = cfg["voice"];
        c.ttsVoice     = v["tts_voice"].get<std::string>();
        c.ttsCommand   = v["tts_command"].get<std::string>();
        c.ttsOutputDir = resolveAgainst(baseDir, v["output_dir"].get<std::string>());

        c.mappingsPath = resolveAgainst(baseDir, cfg["mappings_path"].get<std::string>());

        const auto& l = cfg["logging"];
        c.logFile      = resolveAgainst(baseDir, l["file"].get<std::string>());
        c.logLevel     = l["level"].get<std::string>();
        c.auditLogPath = resolveAgainst(baseDir, l["audit_log"].get<std::string>());
    } catch (const std::exception& e) {
        return ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_PARSE", e.what());
    }

    if (c.sampleRate <= 0 || c.framesPerBuffer <= 0 || c.whisperThreads <= 0) {
        return ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_PARSE",
                                    "audio.sample_rate, audio.frames_per_buffer and "
                                    "whisper.threads must be positive");
    }
    if (isBlank(c.ttsCommand) || c.ttsCommand.find("{out}") == std::string::npos) {
        return ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_PARSE",
                                    "voice.tts_command must contain an {out} placeholder");
    }
    LogLevel ignored;
    if (!parseLogLevel(c.logLevel, ignored)) {
        return ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_PARSE",
                                    "logging.level \"" + c.logLevel + "\" is not one of "
                                    "trace, debug, info, warn, error");
    }

    out = c;
    return StageResult::ok();
}

// ----------------- loader -----------------
StageResult loadConfig(const fs::path& path, AppConfig& out) {
    if (!fs::exists(path)) {
        LOG_PHASE("Config load", false);
        return ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_NOT_FOUND", path.string());
    }

    nlohmann::json doc;
    try {
        std::ifstream f(path);
        if (!f) {
            LOG_PHASE("Config load", false);
            return ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_NOT_FOUND", path.string());
        }
        f >> doc;
    } catch (const std::exception& e) {
        LOG_PHASE("Config load", false);
        return ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_PARSE",
                                    path.string() + ": " + e.what());
    }

    fs::path baseDir = fs::absolute(path).parent_path();
    AppConfig parsed;
    StageResult r = parseConfig(doc, baseDir, parsed);
    if (!r) {
        r.detail = path.string() + ": " + r.detail;
        LOG_PHASE("Config load", false);
        return r;
    }

    parsed.configPath = path;
    out = parsed;
    LOG_PHASE("Config load", true);
    return r;
}

// ----------------- resources -----------------
StageResult validateResources(const AppConfig& cfg, bool needModel) {
    if (!fs::exists(cfg.mappingsPath)) {
        LOG_PHASE("Resource check", false);
        return ErrorManager::report(ErrorKind::Config, "ERR_MAPPINGS_NOT_FOUND",
                                    cfg.mappingsPath.string());
    }

    if (needModel && !fs::is_regular_file(cfg.modelPath)) {
        LOG_PHASE("Resource check", false);
        return ErrorManager::report(ErrorKind::ResourceUnavailable, "ERR_MODEL_NOT_FOUND",
                                    cfg.modelPath.string());
    }

    LOG_PHASE("Resource check", true);
    return StageResult::ok();
}

} // namespace bootstrap_config
