#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>
#include <vector>

#include "error_manager.hpp"

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* VOICEATC_CONFIG_FILE = "voiceatc_config.json";

// Validated runtime configuration. Paths are absolute or relative to the
// process cwd after loading (relative entries resolve against the config dir).
struct AppConfig {
    std::filesystem::path configPath;

    // whisper
    std::filesystem::path modelPath;     // required
    std::string whisperLanguage = "en";
    int whisperThreads = 4;
    int minSpeechMs = 500;
    int minSilenceMs = 1200;
    int maxSegmentMs = 15000;

    // audio
    int inputDeviceIndex = -1;
    int sampleRate = 16000;
    int framesPerBuffer = 4096;
    double silenceThreshold = 0.02;

    // voice
    std::string ttsVoice;
    std::string ttsCommand;
    std::filesystem::path ttsOutputDir;

    std::filesystem::path mappingsPath;

    // logging
    std::filesystem::path logFile;
    std::string logLevel = "info";
    std::filesystem::path auditLogPath;  // empty = disabled
};

// Centralized config bootstrap for VoiceATC
namespace bootstrap_config {

    // Optional keys and their defaults. whisper.model_path is absent on
    // purpose: it is required.
    nlohmann::json defaultConfig();

    // Fill in missing keys (and keys of the wrong type) from 'defaults'.
    // Returns true if anything was patched; 'patchedKeys' gets dotted names.
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defaults,
                       const std::string& prefix = "",
                       std::vector<std::string>* patchedKeys = nullptr);

    // Parse an in-memory document. Relative paths resolve against baseDir.
    StageResult parseConfig(const nlohmann::json& doc,
                            const std::filesystem::path& baseDir,
                            AppConfig& out);

    // Read, merge defaults, validate required fields. Fails closed.
    StageResult loadConfig(const std::filesystem::path& path, AppConfig& out);

    // Check that referenced resources exist. The model check can be skipped
    // for sessions that never load it (console / replay input).
    StageResult validateResources(const AppConfig& cfg, bool needModel);
}
