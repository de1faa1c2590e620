#include "diagnostics.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Session {

const char* stateName(State state) {
    switch (state) {
        case State::Idle:        return "Idle";
        case State::Listening:   return "Listening";
        case State::Matching:    return "Matching";
        case State::Dispatching: return "Dispatching";
        case State::Stopped:     return "Stopped";
    }
    return "Unknown";
}

const char* stopReasonName(StopReason reason) {
    switch (reason) {
        case StopReason::None:              return "none";
        case StopReason::Cancelled:         return "cancelled";
        case StopReason::EndOfInput:        return "end of input";
        case StopReason::RecognizerFailure: return "recognizer failure";
    }
    return "unknown";
}

static std::string isoTimestamp() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

LogDiagnostics::LogDiagnostics(const std::string& auditPath) {
    if (auditPath.empty()) return;

    audit_.open(auditPath, std::ios::out | std::ios::app);
    if (audit_.is_open()) {
        LOG_DEBUG("Diagnostics", "Audit log: " + auditPath);
    } else {
        LOG_WARN("Diagnostics", "Could not open audit log, decisions go to the log only: " + auditPath);
    }
}

void LogDiagnostics::onDecision(const std::string& fragment, const Phrases::MatchResult& result) {
    // Decisions are always reported, whatever logging.level says
    if (result.matched) {
        logUnfiltered(LogLevel::Info, "Session",
                      "Recognized: \"" + fragment + "\" => " + result.phraseId +
                      " (\"" + result.canonicalText + "\" via \"" + result.variant + "\")");
    } else {
        logUnfiltered(LogLevel::Info, "Session", "No match for: \"" + fragment + "\"");
    }

    if (!audit_.is_open()) return;

    nlohmann::json entry = {
        {"time", isoTimestamp()},
        {"fragment", fragment},
        {"matched", result.matched}
    };
    if (result.matched) {
        entry["phrase_id"] = result.phraseId;
        entry["canonical"] = result.canonicalText;
        entry["variant"]   = result.variant;
    }

    std::lock_guard<std::mutex> lock(auditMutex_);
    // replace: recognizer output is not guaranteed to be valid UTF-8
    audit_ << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    audit_.flush();
}

void LogDiagnostics::onSynthesisError(const Phrases::MatchResult& result, const std::string& error) {
    LOG_ERROR("Session", "Could not speak " + result.phraseId + ": " + error);
}

void LogDiagnostics::onStateChange(State from, State to) {
    LOG_TRACE("Session", std::string(stateName(from)) + " -> " + stateName(to));
}

} // namespace Session
