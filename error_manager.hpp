#pragma once

#include <string>
#include <nlohmann/json.hpp>

// ------------------------------------------------------------
// Error kinds
// ------------------------------------------------------------
// Config, ResourceUnavailable and RecognizerIO are fatal.
// Synthesis is reported and processing continues.
enum class ErrorKind {
    None,
    Config,
    ResourceUnavailable,
    RecognizerIO,
    Synthesis
};

const char* errorKindName(ErrorKind kind);
bool isFatal(ErrorKind kind);

// Process exit status for a fatal error of this kind (0 for None).
int exitCodeFor(ErrorKind kind);

// ------------------------------------------------------------
// StageResult: returned by every setup stage
// ------------------------------------------------------------
struct StageResult {
    bool success = true;
    ErrorKind kind = ErrorKind::None;
    std::string errorCode;  // key into the error catalog
    std::string detail;     // what failed and which input was at fault

    static StageResult ok() { return {}; }
    static StageResult fail(ErrorKind kind,
                            const std::string& code,
                            const std::string& detail);

    explicit operator bool() const { return success; }
};

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Compiled-in catalog: { code: { "user": ..., "debug": ... } }
    nlohmann::json defaultErrors();

    // Merge codes from an errors.json document over the defaults.
    // Accepts either { "errors": { ... } } or the bare code object.
    bool load(const std::string& path, std::string* err = nullptr);
    bool loadFromJson(const nlohmann::json& doc, std::string* err = nullptr);

    // Drop loaded overrides and return to the defaults.
    void reset();

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Log the error with its debug message and hand back a failed StageResult.
    StageResult report(ErrorKind kind,
                       const std::string& code,
                       const std::string& detail);

    // One-line, user-facing description: "<user message> (<detail>)"
    std::string describe(const StageResult& result);
}
