#include "transcript.hpp"

#include <cctype>

namespace Voice {

static char closerFor(char open) {
    switch (open) {
        case '[': return ']';
        case '(': return ')';
        case '*': return '*';
    }
    return '\0';
}

std::string cleanTranscript(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    bool pendingSpace = false;
    for (std::size_t i = 0; i < raw.size(); i++) {
        char c = raw[i];

        char closer = closerFor(c);
        if (closer != '\0') {
            std::size_t end = raw.find(closer, i + 1);
            if (end != std::string::npos) {
                i = end;
                pendingSpace = true;
                continue;
            }
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = true;
            continue;
        }

        if (pendingSpace && !out.empty()) out.push_back(' ');
        pendingSpace = false;
        out.push_back(c);
    }

    while (!out.empty() &&
           (out.back() == '.' || out.back() == '!' || out.back() == '?' ||
            out.back() == ',' || out.back() == ' ')) {
        out.pop_back();
    }
    return out;
}

} // namespace Voice
