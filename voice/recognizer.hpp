#pragma once
#include <string>

namespace Voice {

enum class RecognizerStatus {
    Fragment,     // 'text' holds one recognized segment
    EndOfStream,  // finite source exhausted (console / replay)
    Cancelled,    // cancel() was called while waiting
    Failed        // audio or decoder failure; fatal for the session
};

// Source of recognized text fragments, one per speech segment.
class Recognizer {
public:
    virtual ~Recognizer() = default;

    // Blocks until the next fragment is available.
    // On Failed, 'err' (if given) describes what broke.
    virtual RecognizerStatus nextFragment(std::string& text, std::string* err = nullptr) = 0;

    // Unblocks a pending nextFragment(). Must only touch atomics:
    // it is called from signal handlers.
    virtual void cancel() {}

    virtual std::string name() const = 0;
};

} // namespace Voice
