#pragma once

namespace Session {

// Idle -> Listening -> Matching -> Dispatching -> Listening ... -> Stopped
enum class State {
    Idle,
    Listening,
    Matching,
    Dispatching,
    Stopped
};

enum class StopReason {
    None,
    Cancelled,          // requestStop() / SIGINT
    EndOfInput,         // finite recognizer exhausted
    RecognizerFailure   // fatal recognizer error
};

const char* stateName(State state);
const char* stopReasonName(StopReason reason);

} // namespace Session
