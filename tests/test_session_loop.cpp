// =============================================================================
// Session Loop Tests
// =============================================================================

#include <gtest/gtest.h>
#include "session/session_loop.hpp"
#include "session/stop_signals.hpp"

#include <atomic>
#include <csignal>
#include <deque>
#include <functional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#ifndef _WIN32
    #include <pthread.h>
    #include <signal.h>
#endif

using namespace Session;
using Voice::RecognizerStatus;

// ------------------------------------------------------------
// Fakes
// ------------------------------------------------------------
struct ScriptStep {
    RecognizerStatus status;
    std::string text;
};

class ScriptedRecognizer : public Voice::Recognizer {
public:
    ScriptedRecognizer(std::deque<ScriptStep> script, bool* destroyed)
        : script_(std::move(script)), destroyed_(destroyed) {}
    ~ScriptedRecognizer() override {
        if (destroyed_) *destroyed_ = true;
    }

    RecognizerStatus nextFragment(std::string& text, std::string* err) override {
        if (onNext) onNext();
        if (cancelled.load()) return RecognizerStatus::Cancelled;
        if (script_.empty()) return RecognizerStatus::EndOfStream;

        ScriptStep step = script_.front();
        script_.pop_front();
        if (step.status == RecognizerStatus::Failed && err) *err = "device unplugged";
        text = step.text;
        return step.status;
    }

    void cancel() override { cancelled = true; }
    std::string name() const override { return "scripted"; }

    std::function<void()> onNext;
    std::atomic<bool> cancelled{false};

private:
    std::deque<ScriptStep> script_;
    bool* destroyed_;
};

class ThrowingRecognizer : public Voice::Recognizer {
public:
    RecognizerStatus nextFragment(std::string&, std::string*) override {
        throw std::runtime_error("decoder crashed");
    }
    std::string name() const override { return "throwing"; }
};

class RecordingSynthesizer : public Voice::Synthesizer {
public:
    RecordingSynthesizer(std::vector<std::string>* spoken, bool* destroyed)
        : spoken_(spoken), destroyed_(destroyed) {}
    ~RecordingSynthesizer() override {
        if (destroyed_) *destroyed_ = true;
    }

    bool speak(const std::string& text, std::string* err) override {
        if (text == failOn) {
            if (err) *err = "audio device busy";
            return false;
        }
        if (text == throwOn) {
            throw std::runtime_error("tts process died");
        }
        spoken_->push_back(text);
        return true;
    }
    std::string name() const override { return "recording"; }

    std::string failOn;
    std::string throwOn;

private:
    std::vector<std::string>* spoken_;
    bool* destroyed_;
};

class RecordingDiagnostics : public DiagnosticsSink {
public:
    void onDecision(const std::string& fragment, const Phrases::MatchResult& result) override {
        decisions.emplace_back(fragment, result);
    }
    void onSynthesisError(const Phrases::MatchResult& result, const std::string& error) override {
        synthesisErrors.emplace_back(result.phraseId, error);
    }
    void onStateChange(State from, State to) override {
        (void)from;
        states.push_back(to);
    }

    std::vector<std::pair<std::string, Phrases::MatchResult>> decisions;
    std::vector<std::pair<std::string, std::string>> synthesisErrors;
    std::vector<State> states;
};

// ------------------------------------------------------------
// Fixture
// ------------------------------------------------------------
class SessionLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        table = std::make_shared<const Phrases::MappingTable>(std::vector<Phrases::CanonicalPhrase>{
            {"landing_clearance", "Cleared to land runway two seven",
             {"cleared to land", "clear to land"}},
            {"go_around", "Go around", {"go around", "going around"}}
        });
    }

    static ScriptStep fragment(const std::string& text) {
        return {RecognizerStatus::Fragment, text};
    }

    std::unique_ptr<ScriptedRecognizer> recognizer(std::deque<ScriptStep> script) {
        return std::make_unique<ScriptedRecognizer>(std::move(script), &recognizerDestroyed);
    }

    std::unique_ptr<RecordingSynthesizer> synthesizer() {
        return std::make_unique<RecordingSynthesizer>(&spoken, &synthesizerDestroyed);
    }

    Phrases::MappingTablePtr table;
    RecordingDiagnostics diagnostics;
    std::vector<std::string> spoken;
    bool recognizerDestroyed = false;
    bool synthesizerDestroyed = false;
};

// ------------------------------------------------------------
// Ordering
// ------------------------------------------------------------
TEST_F(SessionLoopTest, DispatchesMatchesInArrivalOrder) {
    SessionLoop session(table,
                        recognizer({fragment("go around"),
                                    fragment("say again"),
                                    fragment("you are clear to land now")}),
                        synthesizer(), diagnostics);

    SessionSummary summary = session.run();

    ASSERT_EQ(spoken.size(), 2u);
    EXPECT_EQ(spoken[0], "Go around");
    EXPECT_EQ(spoken[1], "Cleared to land runway two seven");

    EXPECT_EQ(summary.reason, StopReason::EndOfInput);
    EXPECT_TRUE(summary.result.success);
    EXPECT_EQ(summary.fragments, 3u);
    EXPECT_EQ(summary.matched, 2u);
    EXPECT_EQ(summary.unmatched, 1u);
    EXPECT_EQ(summary.synthesisFailures, 0u);
}

// Every fragment is reported, matched or not
TEST_F(SessionLoopTest, ReportsEveryDecision) {
    SessionLoop session(table,
                        recognizer({fragment("going around"), fragment("say again")}),
                        synthesizer(), diagnostics);
    session.run();

    ASSERT_EQ(diagnostics.decisions.size(), 2u);
    EXPECT_EQ(diagnostics.decisions[0].first, "going around");
    EXPECT_TRUE(diagnostics.decisions[0].second.matched);
    EXPECT_EQ(diagnostics.decisions[0].second.phraseId, "go_around");
    EXPECT_EQ(diagnostics.decisions[1].first, "say again");
    EXPECT_FALSE(diagnostics.decisions[1].second.matched);
}

TEST_F(SessionLoopTest, StateSequence) {
    SessionLoop session(table, recognizer({fragment("go around")}), synthesizer(), diagnostics);
    EXPECT_EQ(session.state(), State::Idle);

    session.run();

    std::vector<State> expected = {
        State::Listening,
        State::Matching, State::Dispatching, State::Listening,
        State::Stopped
    };
    EXPECT_EQ(diagnostics.states, expected);
    EXPECT_EQ(session.state(), State::Stopped);
}

// ------------------------------------------------------------
// Failure policy
// ------------------------------------------------------------
TEST_F(SessionLoopTest, SynthesisFailureDoesNotStopSession) {
    auto synth = synthesizer();
    synth->failOn = "Go around";

    SessionLoop session(table,
                        recognizer({fragment("go around"), fragment("cleared to land")}),
                        std::move(synth), diagnostics);
    SessionSummary summary = session.run();

    ASSERT_EQ(spoken.size(), 1u);
    EXPECT_EQ(spoken[0], "Cleared to land runway two seven");
    EXPECT_EQ(summary.synthesisFailures, 1u);
    EXPECT_EQ(summary.reason, StopReason::EndOfInput);
    EXPECT_TRUE(summary.result.success);

    ASSERT_EQ(diagnostics.synthesisErrors.size(), 1u);
    EXPECT_EQ(diagnostics.synthesisErrors[0].first, "go_around");
    EXPECT_EQ(diagnostics.synthesisErrors[0].second, "audio device busy");
}

TEST_F(SessionLoopTest, ThrowingSynthesizerIsIsolated) {
    auto synth = synthesizer();
    synth->throwOn = "Go around";

    SessionLoop session(table,
                        recognizer({fragment("go around"), fragment("cleared to land")}),
                        std::move(synth), diagnostics);
    SessionSummary summary = session.run();

    EXPECT_EQ(spoken.size(), 1u);
    EXPECT_EQ(summary.synthesisFailures, 1u);
    ASSERT_EQ(diagnostics.synthesisErrors.size(), 1u);
    EXPECT_EQ(diagnostics.synthesisErrors[0].second, "tts process died");
}

TEST_F(SessionLoopTest, RecognizerFailureIsFatal) {
    SessionLoop session(table,
                        recognizer({fragment("go around"),
                                    {RecognizerStatus::Failed, ""},
                                    fragment("cleared to land")}),
                        synthesizer(), diagnostics);
    SessionSummary summary = session.run();

    ASSERT_EQ(spoken.size(), 1u);
    EXPECT_EQ(summary.reason, StopReason::RecognizerFailure);
    EXPECT_FALSE(summary.result.success);
    EXPECT_EQ(summary.result.kind, ErrorKind::RecognizerIO);
    EXPECT_EQ(summary.result.errorCode, "ERR_RECOGNIZER_IO");
    EXPECT_NE(summary.result.detail.find("device unplugged"), std::string::npos);
    EXPECT_EQ(session.state(), State::Stopped);
}

TEST_F(SessionLoopTest, RecognizerExceptionIsFatal) {
    SessionLoop session(table, std::make_unique<ThrowingRecognizer>(), synthesizer(), diagnostics);
    SessionSummary summary = session.run();

    EXPECT_EQ(summary.reason, StopReason::RecognizerFailure);
    EXPECT_EQ(summary.result.kind, ErrorKind::RecognizerIO);
    EXPECT_NE(summary.result.detail.find("decoder crashed"), std::string::npos);
    EXPECT_FALSE(session.holdsHandles());
}

// ------------------------------------------------------------
// Cancellation and release
// ------------------------------------------------------------
TEST_F(SessionLoopTest, StopBeforeRunNeverReadsFragments) {
    SessionLoop session(table, recognizer({fragment("go around")}), synthesizer(), diagnostics);
    session.requestStop();

    SessionSummary summary = session.run();

    EXPECT_EQ(summary.reason, StopReason::Cancelled);
    EXPECT_EQ(summary.fragments, 0u);
    EXPECT_TRUE(spoken.empty());
    EXPECT_TRUE(summary.result.success);
}

// Stop requested mid-session is seen at the top of the next iteration
TEST_F(SessionLoopTest, StopMidSessionFinishesCurrentFragment) {
    auto rec = recognizer({fragment("go around"), fragment("cleared to land"), fragment("go around")});
    ScriptedRecognizer* raw = rec.get();

    SessionLoop session(table, std::move(rec), synthesizer(), diagnostics);

    int calls = 0;
    raw->onNext = [&]() {
        if (++calls == 2) session.requestStop();
    };

    SessionSummary summary = session.run();

    EXPECT_EQ(summary.reason, StopReason::Cancelled);
    EXPECT_EQ(summary.fragments, 1u);
    ASSERT_EQ(spoken.size(), 1u);
    EXPECT_EQ(spoken[0], "Go around");
    EXPECT_TRUE(session.stopRequested());
}

TEST_F(SessionLoopTest, HandlesReleasedOnEndOfInput) {
    SessionLoop session(table, recognizer({fragment("go around")}), synthesizer(), diagnostics);
    EXPECT_TRUE(session.holdsHandles());

    session.run();

    EXPECT_TRUE(recognizerDestroyed);
    EXPECT_TRUE(synthesizerDestroyed);
    EXPECT_FALSE(session.holdsHandles());
}

TEST_F(SessionLoopTest, HandlesReleasedOnFailure) {
    SessionLoop session(table, recognizer({{RecognizerStatus::Failed, ""}}), synthesizer(), diagnostics);
    session.run();

    EXPECT_TRUE(recognizerDestroyed);
    EXPECT_TRUE(synthesizerDestroyed);
}

TEST_F(SessionLoopTest, HandlesReleasedOnCancel) {
    SessionLoop session(table, recognizer({fragment("go around")}), synthesizer(), diagnostics);
    session.requestStop();
    session.run();

    EXPECT_TRUE(recognizerDestroyed);
    EXPECT_TRUE(synthesizerDestroyed);
}

TEST_F(SessionLoopTest, HandlesReleasedWhenNeverRun) {
    {
        SessionLoop session(table, recognizer({}), synthesizer(), diagnostics);
    }
    EXPECT_TRUE(recognizerDestroyed);
    EXPECT_TRUE(synthesizerDestroyed);
}

// requestStop after the handles are gone must not touch the recognizer
TEST_F(SessionLoopTest, RequestStopAfterRunIsSafe) {
    SessionLoop session(table, recognizer({}), synthesizer(), diagnostics);
    session.run();
    session.requestStop();
    EXPECT_TRUE(session.stopRequested());
}

// ------------------------------------------------------------
// Contract
// ------------------------------------------------------------
TEST_F(SessionLoopTest, RunTwiceThrows) {
    SessionLoop session(table, recognizer({}), synthesizer(), diagnostics);
    session.run();
    EXPECT_THROW(session.run(), std::logic_error);
}

TEST_F(SessionLoopTest, RejectsMissingCollaborators) {
    EXPECT_THROW(SessionLoop(nullptr, recognizer({}), synthesizer(), diagnostics),
                 std::invalid_argument);
    EXPECT_THROW(SessionLoop(table, nullptr, synthesizer(), diagnostics),
                 std::invalid_argument);
    EXPECT_THROW(SessionLoop(table, recognizer({}), nullptr, diagnostics),
                 std::invalid_argument);
}

// One table, independent sessions
TEST_F(SessionLoopTest, SessionsShareOneTable) {
    std::vector<std::string> spokenB;

    SessionLoop a(table, recognizer({fragment("go around")}), synthesizer(), diagnostics);
    RecordingDiagnostics diagnosticsB;
    SessionLoop b(table,
                  std::make_unique<ScriptedRecognizer>(std::deque<ScriptStep>{fragment("clear to land")}, nullptr),
                  std::make_unique<RecordingSynthesizer>(&spokenB, nullptr),
                  diagnosticsB);

    a.run();
    b.run();

    ASSERT_EQ(spoken.size(), 1u);
    ASSERT_EQ(spokenB.size(), 1u);
    EXPECT_EQ(spoken[0], "Go around");
    EXPECT_EQ(spokenB[0], "Cleared to land runway two seven");
    EXPECT_EQ(table.use_count(), 3);
}

// ------------------------------------------------------------
// Stopping from other threads and from signals
// ------------------------------------------------------------
TEST_F(SessionLoopTest, ConcurrentStopWhileReleasing) {
    for (int round = 0; round < 50; ++round) {
        auto session = std::make_unique<SessionLoop>(
            table, recognizer({fragment("roger"), fragment("go around")}), synthesizer(), diagnostics);

        std::atomic<bool> done{false};
        std::thread stopper([&] {
            while (!done.load()) session->requestStop();
        });
        session->run();
        EXPECT_FALSE(session->holdsHandles());
        done.store(true);
        stopper.join();
    }
}

#ifndef _WIN32
TEST_F(SessionLoopTest, StopSignalReachesRecognizer) {
    auto rec = recognizer({fragment("go around")});
    ScriptedRecognizer* raw = rec.get();
    SessionLoop session(table, std::move(rec), synthesizer(), diagnostics);

    installStopHandlers(&session);
    struct sigaction current {};
    sigaction(SIGINT, nullptr, &current);
    std::raise(SIGINT);
    restoreStopHandlers();

    // Terminal reads must come back on Ctrl+C rather than restart
    EXPECT_EQ(current.sa_flags & SA_RESTART, 0);
    EXPECT_TRUE(session.stopRequested());
    EXPECT_TRUE(raw->cancelled.load());

    SessionSummary summary = session.run();
    EXPECT_EQ(summary.reason, StopReason::Cancelled);
    EXPECT_TRUE(spoken.empty());
}

TEST_F(SessionLoopTest, BlockedStopSignalsAreInherited) {
    bool blockedInChild = false;
    std::thread owner([&] {
        blockStopSignals();
        std::thread worker([&] {
            sigset_t mask;
            pthread_sigmask(SIG_BLOCK, nullptr, &mask);
            blockedInChild = sigismember(&mask, SIGINT) == 1 && sigismember(&mask, SIGTERM) == 1;
        });
        worker.join();
    });
    owner.join();
    EXPECT_TRUE(blockedInChild);
}
#endif
