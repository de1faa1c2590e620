#include "session_loop.hpp"
#include "phrases/matcher.hpp"
#include "logger.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

namespace Session {

SessionLoop::SessionLoop(Phrases::MappingTablePtr table,
                         std::unique_ptr<Voice::Recognizer> recognizer,
                         std::unique_ptr<Voice::Synthesizer> synthesizer,
                         DiagnosticsSink& diagnostics)
    : table_(std::move(table)),
      recognizer_(std::move(recognizer)),
      synthesizer_(std::move(synthesizer)),
      diagnostics_(diagnostics) {
    if (!table_ || !recognizer_ || !synthesizer_) {
        throw std::invalid_argument("SessionLoop needs a table, a recognizer and a synthesizer");
    }
    cancelTarget_.store(recognizer_.get());
}

SessionLoop::~SessionLoop() {
    releaseHandles();
}

void SessionLoop::requestStop() {
    stopRequested_.store(true);
    stopsInFlight_.fetch_add(1);
    if (Voice::Recognizer* r = cancelTarget_.load()) {
        r->cancel();
    }
    stopsInFlight_.fetch_sub(1);
}

void SessionLoop::setState(State next) {
    State prev = state_.exchange(next);
    if (prev != next) {
        diagnostics_.onStateChange(prev, next);
    }
}

void SessionLoop::releaseHandles() {
    cancelTarget_.store(nullptr);
    // A requestStop() on another thread may still hold the old pointer
    while (stopsInFlight_.load() > 0) {
        std::this_thread::yield();
    }
    recognizer_.reset();
    synthesizer_.reset();
}

void SessionLoop::dispatch(const Phrases::MatchResult& result, SessionSummary& summary) {
    if (!result.matched) return;

    std::string err;
    bool ok = false;
    try {
        ok = synthesizer_->speak(result.canonicalText, &err);
    } catch (const std::exception& e) {
        err = e.what();
    }

    if (!ok) {
        summary.synthesisFailures++;
        if (err.empty()) err = "synthesizer reported failure";
        diagnostics_.onSynthesisError(result, err);
        ErrorManager::report(ErrorKind::Synthesis, "ERR_SYNTHESIS_FAILED",
                             result.phraseId + ": " + err);
    }
}

// ------------------------------------------------------------
// Main loop
// ------------------------------------------------------------
SessionSummary SessionLoop::run() {
    SessionSummary summary;

    if (state_.load() != State::Idle) {
        throw std::logic_error("SessionLoop::run called more than once");
    }

    // Release handles on every way out of this function
    struct ReleaseOnExit {
        SessionLoop& self;
        ~ReleaseOnExit() {
            self.setState(State::Stopped);
            self.releaseHandles();
        }
    } guard{*this};

    LOG_PHASE("Session start (" + recognizer_->name() + " -> " + synthesizer_->name() + ")", true);
    setState(State::Listening);

    while (true) {
        if (stopRequested_.load()) {
            summary.reason = StopReason::Cancelled;
            break;
        }

        std::string text;
        std::string err;
        Voice::RecognizerStatus status;
        try {
            status = recognizer_->nextFragment(text, &err);
        } catch (const std::exception& e) {
            status = Voice::RecognizerStatus::Failed;
            err = e.what();
        }

        if (status == Voice::RecognizerStatus::Cancelled) {
            summary.reason = StopReason::Cancelled;
            break;
        }
        if (status == Voice::RecognizerStatus::EndOfStream) {
            summary.reason = StopReason::EndOfInput;
            break;
        }
        if (status == Voice::RecognizerStatus::Failed) {
            summary.reason = StopReason::RecognizerFailure;
            summary.result = ErrorManager::report(ErrorKind::RecognizerIO, "ERR_RECOGNIZER_IO",
                                                  recognizer_->name() + ": " +
                                                  (err.empty() ? "unknown error" : err));
            break;
        }

        summary.fragments++;

        setState(State::Matching);
        Phrases::MatchResult result = Phrases::match(text, *table_);
        if (result.matched) {
            summary.matched++;
        } else {
            summary.unmatched++;
        }
        diagnostics_.onDecision(text, result);

        setState(State::Dispatching);
        dispatch(result, summary);

        setState(State::Listening);
    }

    LOG_PHASE("Session stopped (" + std::string(stopReasonName(summary.reason)) + ")",
              summary.result.success);
    LOG_INFO("Session", std::to_string(summary.fragments) + " fragments, " +
                        std::to_string(summary.matched) + " matched, " +
                        std::to_string(summary.unmatched) + " unmatched, " +
                        std::to_string(summary.synthesisFailures) + " synthesis failures");
    return summary;
}

} // namespace Session
