#include "synthesizer.hpp"

#include <ostream>

namespace Voice {

ConsoleSynthesizer::ConsoleSynthesizer(std::ostream& out) : out_(out) {}

bool ConsoleSynthesizer::speak(const std::string& text, std::string* err) {
    out_ << text << std::endl;
    if (!out_) {
        if (err) *err = "console output stream failed";
        return false;
    }
    return true;
}

} // namespace Voice
