#pragma once
#include <fstream>
#include <mutex>
#include <string>

#include "phrases/matcher.hpp"
#include "session_state.hpp"

namespace Session {

// Receives every decision the session makes. Injected into SessionLoop.
class DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;

    // Called once per fragment, matched or not.
    virtual void onDecision(const std::string& fragment, const Phrases::MatchResult& result) = 0;

    virtual void onSynthesisError(const Phrases::MatchResult& result, const std::string& error) = 0;

    virtual void onStateChange(State from, State to) { (void)from; (void)to; }
};

// Writes decisions through the logger and, when an audit path is set,
// appends one JSON object per decision for offline review.
class LogDiagnostics : public DiagnosticsSink {
public:
    LogDiagnostics() = default;
    explicit LogDiagnostics(const std::string& auditPath);

    bool auditEnabled() const { return audit_.is_open(); }

    void onDecision(const std::string& fragment, const Phrases::MatchResult& result) override;
    void onSynthesisError(const Phrases::MatchResult& result, const std::string& error) override;
    void onStateChange(State from, State to) override;

private:
    std::mutex auditMutex_;
    std::ofstream audit_;
};

} // namespace Session
