#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include "phrases/phrase_map.hpp"
#include "voice/recognizer.hpp"
#include "voice/synthesizer.hpp"
#include "error_manager.hpp"
#include "session_state.hpp"
#include "diagnostics.hpp"

namespace Session {

struct SessionSummary {
    StopReason reason = StopReason::None;
    std::size_t fragments = 0;
    std::size_t matched = 0;
    std::size_t unmatched = 0;
    std::size_t synthesisFailures = 0;

    // success == false only for a fatal recognizer failure
    StageResult result;
};

/// SessionLoop
/// Drives one listening session: pulls fragments from the recognizer one at a
/// time, matches each against the shared table, and speaks matches in arrival
/// order. Owns the recognizer and synthesizer and releases both on entering
/// Stopped, whatever caused the stop.
class SessionLoop {
public:
    SessionLoop(Phrases::MappingTablePtr table,
                std::unique_ptr<Voice::Recognizer> recognizer,
                std::unique_ptr<Voice::Synthesizer> synthesizer,
                DiagnosticsSink& diagnostics);
    ~SessionLoop();

    SessionLoop(const SessionLoop&) = delete;
    SessionLoop& operator=(const SessionLoop&) = delete;

    /// Runs until cancelled, end of input, or a recognizer failure.
    /// May be called once.
    SessionSummary run();

    /// Async-signal-safe: atomic stores plus the recognizer's cancel().
    /// Call from the thread that runs the session (see stop_signals.hpp).
    void requestStop();

    bool stopRequested() const { return stopRequested_.load(); }
    State state() const { return state_.load(); }
    bool holdsHandles() const { return recognizer_ != nullptr || synthesizer_ != nullptr; }

private:
    void setState(State next);
    void dispatch(const Phrases::MatchResult& result, SessionSummary& summary);
    void releaseHandles();

    Phrases::MappingTablePtr table_;
    std::unique_ptr<Voice::Recognizer> recognizer_;
    std::unique_ptr<Voice::Synthesizer> synthesizer_;
    DiagnosticsSink& diagnostics_;

    // Raw view for requestStop(); valid while recognizer_ is held
    std::atomic<Voice::Recognizer*> cancelTarget_{nullptr};
    std::atomic<int> stopsInFlight_{0};
    std::atomic<bool> stopRequested_{false};
    std::atomic<State> state_{State::Idle};
};

} // namespace Session
