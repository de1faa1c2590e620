#include "tts_command.hpp"

namespace Voice {

std::string shellQuote(const std::string& value) {
#ifdef _WIN32
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += "\\\"";
        else out.push_back(c);
    }
    return out + "\"";
#else
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    return out + "'";
#endif
}

std::string expandTtsCommand(const std::string& pattern,
                             const std::string& voice,
                             const std::string& outFile) {
    static const std::string kVoice = "{voice}";
    static const std::string kOut = "{out}";

    std::string cmd;
    cmd.reserve(pattern.size() + voice.size() + outFile.size());

    std::size_t i = 0;
    while (i < pattern.size()) {
        if (pattern.compare(i, kVoice.size(), kVoice) == 0) {
            cmd += shellQuote(voice);
            i += kVoice.size();
        } else if (pattern.compare(i, kOut.size(), kOut) == 0) {
            cmd += shellQuote(outFile);
            i += kOut.size();
        } else {
            cmd.push_back(pattern[i++]);
        }
    }
    return cmd;
}

} // namespace Voice
