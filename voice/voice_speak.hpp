#pragma once
#include <filesystem>
#include <string>

#include "synthesizer.hpp"
#include "bootstrap_config.hpp"

namespace Voice {

// Renders each phrase with an external TTS command, then plays the WAV
// through SFML and waits for playback to finish.
//
// voice.tts_command is run through the shell with {voice} and {out}
// replaced (both shell-quoted); the phrase text is written to its stdin.
class TtsSynthesizer : public Synthesizer {
public:
    explicit TtsSynthesizer(const AppConfig& cfg);
    ~TtsSynthesizer() override;

    bool speak(const std::string& text, std::string* err = nullptr) override;
    std::string name() const override { return "tts:" + voice_; }

private:
    bool render(const std::string& text, const std::string& outFile, std::string* err);
    bool play(const std::string& wavPath, std::string* err);

    std::string command_;
    std::string voice_;
    std::filesystem::path outputDir_;
};

} // namespace Voice
