#include "console_recognizer.hpp"
#include "logger.hpp"

#include <iostream>

namespace Voice {

ConsoleRecognizer::ConsoleRecognizer(std::istream& in, bool prompt)
    : in_(&in), prompt_(prompt), name_("console") {}

ConsoleRecognizer::ConsoleRecognizer(const std::string& path)
    : file_(std::make_unique<std::ifstream>(path)), name_("replay:" + path) {
    if (file_->is_open()) {
        in_ = file_.get();
    } else {
        LOG_ERROR("Replay", "Could not open replay file: " + path);
    }
}

RecognizerStatus ConsoleRecognizer::nextFragment(std::string& text, std::string* err) {
    if (!in_) {
        if (err) *err = name_ + " is not open";
        return RecognizerStatus::Failed;
    }

    std::string line;
    while (true) {
        if (cancelled_.load()) return RecognizerStatus::Cancelled;

        if (prompt_) {
            std::cout << "> " << std::flush;
        }

        bool got = static_cast<bool>(std::getline(*in_, line));

        // A stop during a blocked read wins over whatever the read produced
        if (cancelled_.load()) return RecognizerStatus::Cancelled;

        if (!got) {
            if (in_->bad()) {
                if (err) *err = name_ + ": read error after line " + std::to_string(lineNo_);
                return RecognizerStatus::Failed;
            }
            return RecognizerStatus::EndOfStream; // EOF / Ctrl+D
        }
        lineNo_++;

        if (!line.empty() && line.back() == '\r') line.pop_back();

        // Blank lines and '#' comments carry no speech
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (prompt_ && (line == "quit" || line == "exit")) {
            LOG_PHASE("Shutdown requested", true);
            return RecognizerStatus::EndOfStream;
        }

        LOG_TRACE("Console", "Fragment " + std::to_string(lineNo_) + ": " + line);
        text = line;
        return RecognizerStatus::Fragment;
    }
}

} // namespace Voice
