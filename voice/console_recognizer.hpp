#pragma once
#include <atomic>
#include <fstream>
#include <iosfwd>
#include <memory>
#include <string>

#include "recognizer.hpp"

namespace Voice {

// Reads one fragment per line: stdin for typing phrases by hand, or a
// transcript file for replaying a recorded session.
class ConsoleRecognizer : public Recognizer {
public:
    // Reads from a stream owned by the caller (std::cin, a test stringstream).
    explicit ConsoleRecognizer(std::istream& in, bool prompt = false);

    // Opens and owns 'path'. Check isOpen() before use.
    explicit ConsoleRecognizer(const std::string& path);

    bool isOpen() const { return in_ != nullptr; }

    RecognizerStatus nextFragment(std::string& text, std::string* err = nullptr) override;
    void cancel() override { cancelled_.store(true); }
    std::string name() const override { return name_; }

private:
    std::unique_ptr<std::ifstream> file_;
    std::istream* in_ = nullptr;
    bool prompt_ = false;
    std::string name_;
    std::atomic<bool> cancelled_{false};
    std::size_t lineNo_ = 0;
};

} // namespace Voice
