#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

// =====================================================
// State
// =====================================================
#if defined(_DEBUG) || !defined(NDEBUG)
static std::atomic<LogLevel> g_minLevel{LogLevel::Debug};
#else
static std::atomic<LogLevel> g_minLevel{LogLevel::Info};
#endif

static std::mutex g_logMutex;
static std::ofstream g_logFile;
static LogRecord g_lastPhase;
static LogObserver g_observer;

// 🔹 Held back while a phase group is open
static bool g_grouping = false;
static std::vector<LogRecord> g_pending;

// =====================================================
// Formatting
// =====================================================
static std::string stamp(const std::chrono::system_clock::time_point& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

static std::string fileNameOf(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

// [time][LEVEL][tag] message
// [time][PHASE][file] phase -> ok | FAILED
static std::string format(const LogRecord& r) {
    std::string line = "[" + stamp(r.time) + "][" + logLevelName(r.level) + "][" + r.tag + "] " +
                       r.message;
    if (r.level == LogLevel::Phase) {
        line += r.success ? " -> ok" : " -> FAILED";
    }
    return line;
}

// Caller holds g_logMutex
static void emit(const LogRecord& r) {
    std::string line = format(r);
    if (g_logFile.is_open()) {
        g_logFile << line << '\n';
        if (r.level >= LogLevel::Warn) g_logFile.flush();
    }
    std::cerr << line << std::endl;

    if (g_observer) g_observer(r);
}

// Caller holds g_logMutex
static void flushPending() {
    for (const auto& r : g_pending) {
        emit(r);
    }
    g_pending.clear();
    g_grouping = false;
}

static void submit(LogRecord r) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    bool holdBack = g_grouping && (r.level == LogLevel::Phase || r.level < LogLevel::Warn);
    if (holdBack) {
        g_pending.push_back(std::move(r));
    } else {
        emit(r);
    }
}

// =====================================================
// Levels
// =====================================================
const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Phase: return "PHASE";
    }
    return "?";
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<const char*, LogLevel> kNames[] = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error}
    };
    for (const auto& [text, level] : kNames) {
        if (key == text) {
            out = level;
            return true;
        }
    }
    return false;
}

void setLogLevel(LogLevel level) {
    // Phase is not a filter threshold
    if (level == LogLevel::Phase) level = LogLevel::Error;
    g_minLevel.store(level);
}

LogLevel logLevel() {
    return g_minLevel.load();
}

// =====================================================
// Records
// =====================================================
LogRecord lastPhase() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_lastPhase;
}

void setLogObserver(LogObserver observer) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_observer = std::move(observer);
}

void logPhaseInternal(const std::string& file, const std::string& phase, bool success) {
    LogRecord r;
    r.time    = std::chrono::system_clock::now();
    r.level   = LogLevel::Phase;
    r.tag     = fileNameOf(file);
    r.message = phase;
    r.success = success;

    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        g_lastPhase = r;
    }
    submit(std::move(r));
}

void logMessage(LogLevel level, const std::string& tag, const std::string& msg) {
    if (level < g_minLevel.load()) return;
    logUnfiltered(level, tag, msg);
}

void logUnfiltered(LogLevel level, const std::string& tag, const std::string& msg) {
    LogRecord r;
    r.time    = std::chrono::system_clock::now();
    r.level   = level;
    r.tag     = tag;
    r.message = msg;
    submit(std::move(r));
}

// =====================================================
// Phase groups
// =====================================================
void beginPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_pending.clear();
    g_grouping = true;
}

void endPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    flushPending();
}

// =====================================================
// Lifecycle
// =====================================================
bool initLogger(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMutex);

    if (g_logFile.is_open()) {
        g_logFile << "==== VoiceATC Log Ended ====" << std::endl;
        g_logFile.close();
    }

    std::error_code ec;
    fs::path path = fs::absolute(filename, ec);
    if (ec) path = filename;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }

    g_logFile.open(path, std::ios::out | std::ios::app);
    if (!g_logFile.is_open()) {
        std::cerr << "[Logger] Could not open log file: " << path.string() << std::endl;
        return false;
    }

    g_logFile << "==== VoiceATC Log Started " << stamp(std::chrono::system_clock::now())
              << " ====" << std::endl;
    std::cerr << "[Logger] Writing logs to: " << path.string() << std::endl;
    return true;
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    flushPending();

    if (g_logFile.is_open()) {
        g_logFile << "==== VoiceATC Log Ended ====" << std::endl;
        g_logFile.close();
    }
}
