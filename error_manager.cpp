#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>
#include <mutex>

// ------------------------------------------------------------
// Error kinds
// ------------------------------------------------------------
const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "None";
        case ErrorKind::Config:              return "ConfigError";
        case ErrorKind::ResourceUnavailable: return "ResourceUnavailable";
        case ErrorKind::RecognizerIO:        return "RecognizerIOError";
        case ErrorKind::Synthesis:           return "SynthesisError";
    }
    return "Unknown";
}

bool isFatal(ErrorKind kind) {
    return kind == ErrorKind::Config ||
           kind == ErrorKind::ResourceUnavailable ||
           kind == ErrorKind::RecognizerIO;
}

int exitCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return 0;
        case ErrorKind::Config:              return 2;
        case ErrorKind::ResourceUnavailable: return 3;
        case ErrorKind::RecognizerIO:        return 4;
        case ErrorKind::Synthesis:           return 1;
    }
    return 1;
}

StageResult StageResult::fail(ErrorKind kind,
                              const std::string& code,
                              const std::string& detail) {
    StageResult r;
    r.success   = false;
    r.kind      = kind;
    r.errorCode = code;
    r.detail    = detail;
    return r;
}

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
static std::mutex g_catalogMutex;
static nlohmann::json g_catalog = ErrorManager::defaultErrors();

namespace ErrorManager {

nlohmann::json defaultErrors() {
    return {
        {"ERR_CONFIG_NOT_FOUND", {
            {"user", "[Config] Configuration file not found."},
            {"debug", "Config path does not exist or could not be opened."}
        }},
        {"ERR_CONFIG_PARSE", {
            {"user", "[Config] Configuration file is not valid JSON."},
            {"debug", "nlohmann::json parse failed on the config document."}
        }},
        {"ERR_CONFIG_MISSING_FIELD", {
            {"user", "[Config] A required configuration field is missing."},
            {"debug", "Required key absent, blank, or not a string after default merge."}
        }},
        {"ERR_MAPPINGS_NOT_FOUND", {
            {"user", "[Mappings] Phrase mappings file not found."},
            {"debug", "mappings_path does not exist or could not be opened."}
        }},
        {"ERR_MAPPINGS_INVALID", {
            {"user", "[Mappings] Phrase mappings file is invalid."},
            {"debug", "Mapping document failed structural validation; no table was built."}
        }},
        {"ERR_MODEL_NOT_FOUND", {
            {"user", "[Voice] Whisper model not found. Download a ggml model from "
                     "https://huggingface.co/ggerganov/whisper.cpp and set whisper.model_path."},
            {"debug", "whisper.model_path does not name an existing file."}
        }},
        {"ERR_MODEL_LOAD_FAILED", {
            {"user", "[Voice] Whisper model could not be loaded."},
            {"debug", "whisper_init_from_file_with_params returned null."}
        }},
        {"ERR_AUDIO_DEVICE", {
            {"user", "[Audio] Microphone could not be opened."},
            {"debug", "PortAudio init, device selection, or stream open failed."}
        }},
        {"ERR_RECOGNIZER_IO", {
            {"user", "[Voice] Speech recognizer stopped delivering audio."},
            {"debug", "Recognizer::nextFragment reported failure; session stopped."}
        }},
        {"ERR_SYNTHESIS_FAILED", {
            {"user", "[TTS] Could not speak phrase."},
            {"debug", "Synthesizer::speak failed; fragment skipped, session continues."}
        }},
        {"ERR_REPLAY_NOT_FOUND", {
            {"user", "[Replay] Replay file not found."},
            {"debug", "--replay path could not be opened."}
        }}
    };
}

bool loadFromJson(const nlohmann::json& doc, std::string* err) {
    const nlohmann::json& codes =
        (doc.is_object() && doc.contains("errors") && doc["errors"].is_object())
            ? doc["errors"] : doc;

    if (!codes.is_object()) {
        if (err) *err = "error catalog must be a JSON object";
        return false;
    }

    std::lock_guard<std::mutex> lock(g_catalogMutex);
    for (auto& [code, entry] : codes.items()) {
        if (!entry.is_object()) {
            LOG_WARN("ErrorManager", "Skipping malformed entry: " + code);
            continue;
        }
        g_catalog[code] = entry;
    }
    return true;
}

bool load(const std::string& path, std::string* err) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        if (err) *err = "Could not open " + path;
        return false;
    }

    try {
        nlohmann::json doc;
        in >> doc;
        if (!loadFromJson(doc, err)) return false;
    } catch (const std::exception& e) {
        if (err) *err = "Failed to parse " + path + " -> " + e.what();
        return false;
    }

    LOG_DEBUG("ErrorManager", "Loaded error catalog from: " + fs::absolute(path).string());
    return true;
}

void reset() {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    g_catalog = defaultErrors();
}

static std::string lookup(const std::string& code, const char* field) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    auto it = g_catalog.find(code);
    if (it != g_catalog.end() && it->contains(field) && (*it)[field].is_string()) {
        return (*it)[field].get<std::string>();
    }
    return {};
}

std::string getUserMessage(const std::string& code) {
    std::string msg = lookup(code, "user");
    return msg.empty() ? "[Error] Unknown error code: " + code : msg;
}

std::string getDebugMessage(const std::string& code) {
    std::string msg = lookup(code, "debug");
    return msg.empty() ? "[Debug] No debug message for code: " + code : msg;
}

StageResult report(ErrorKind kind,
                   const std::string& code,
                   const std::string& detail) {
    std::string line = std::string(errorKindName(kind)) + " " + code + " -> " +
                       getDebugMessage(code);
    if (!detail.empty()) line += " [" + detail + "]";

    if (isFatal(kind)) {
        LOG_ERROR("ErrorManager", line);
    } else {
        LOG_WARN("ErrorManager", line);
    }
    return StageResult::fail(kind, code, detail);
}

std::string describe(const StageResult& result) {
    if (result.success) return "ok";
    std::string msg = getUserMessage(result.errorCode);
    if (!result.detail.empty()) msg += " (" + result.detail + ")";
    return msg;
}

} // namespace ErrorManager
