#pragma once
#include <chrono>
#include <functional>
#include <string>

// =====================================================
// Levels (lowest first)
// =====================================================
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Phase   // startup / shutdown milestones, never filtered
};

const char* logLevelName(LogLevel level);

// "trace" / "debug" / "info" / "warn" / "error", any case.
// Leaves 'out' untouched on an unknown name.
bool parseLogLevel(const std::string& name, LogLevel& out);

// Lines below this level are dropped. Debug builds start at Debug,
// release builds at Info.
void setLogLevel(LogLevel level);
LogLevel logLevel();

// =====================================================
// Records
// =====================================================
struct LogRecord {
    std::chrono::system_clock::time_point time;
    LogLevel level = LogLevel::Info;
    std::string tag;       // subsystem, or source file name for phases
    std::string message;
    bool success = true;   // phases only
};

// Most recent LOG_PHASE; names the failing stage in fatal exits.
LogRecord lastPhase();

// Sees every record that is written (after the level filter).
// Runs under the logger lock: must not log.
// Pass an empty function to remove. Used by tests.
using LogObserver = std::function<void(const LogRecord&)>;
void setLogObserver(LogObserver observer);

// =====================================================
// Lifecycle
// =====================================================

// Appends to 'filename' in addition to stderr. Calling again switches files.
bool initLogger(const std::string& filename);

// Flushes any buffered group and closes the file.
void shutdownLogger();

// =====================================================
// Writers
// =====================================================
void logPhaseInternal(const std::string& file, const std::string& phase, bool success);
void logMessage(LogLevel level, const std::string& tag, const std::string& msg);
// Same record as logMessage but never dropped by the level filter.
void logUnfiltered(LogLevel level, const std::string& tag, const std::string& msg);

// Phases and lines below Warn are held back until endPhaseGroup(), so the
// startup block lands in the log file once it has been opened.
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Macros
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_TRACE(tag, msg) logMessage(LogLevel::Trace, tag, msg)
#define LOG_DEBUG(tag, msg) logMessage(LogLevel::Debug, tag, msg)
#define LOG_INFO(tag, msg)  logMessage(LogLevel::Info, tag, msg)
#define LOG_WARN(tag, msg)  logMessage(LogLevel::Warn, tag, msg)
#define LOG_ERROR(tag, msg) logMessage(LogLevel::Error, tag, msg)
