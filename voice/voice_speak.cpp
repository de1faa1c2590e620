#include "voice_speak.hpp"
#include "tts_command.hpp"
#include "logger.hpp"

#include <SFML/Audio.hpp>
#include <chrono>
#include <cstdio>
#include <random>
#include <thread>

#ifdef _WIN32
    #define VOICEATC_POPEN  _popen
    #define VOICEATC_PCLOSE _pclose
#else
    #define VOICEATC_POPEN  popen
    #define VOICEATC_PCLOSE pclose
#endif

namespace fs = std::filesystem;

namespace Voice {

// =========================================================
// Helpers
// =========================================================
static std::string randomString(size_t length) {
    static const char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 rg{std::random_device{}()};
    static thread_local std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; i++) {
        result.push_back(charset[dist(rg)]);
    }
    return result;
}

// =========================================================
// Init / Shutdown
// =========================================================
TtsSynthesizer::TtsSynthesizer(const AppConfig& cfg)
    : command_(cfg.ttsCommand),
      voice_(cfg.ttsVoice),
      outputDir_(cfg.ttsOutputDir.empty() ? fs::temp_directory_path() / "voiceatc"
                                          : cfg.ttsOutputDir) {
    LOG_DEBUG("Voice/TTS", "Command: " + command_ + " (voice=" + voice_ +
                           ", out=" + outputDir_.string() + ")");
}

TtsSynthesizer::~TtsSynthesizer() {
    LOG_PHASE("Voice TTS shutdown", true);
}

// =========================================================
// Render text -> wav
// =========================================================
bool TtsSynthesizer::render(const std::string& text, const std::string& outFile, std::string* err) {
    std::string cmd = expandTtsCommand(command_, voice_, outFile);
    LOG_TRACE("Voice/TTS", "Running: " + cmd);

    FILE* pipe = VOICEATC_POPEN(cmd.c_str(), "w");
    if (!pipe) {
        if (err) *err = "could not start TTS command: " + cmd;
        return false;
    }

    size_t written = fwrite(text.data(), 1, text.size(), pipe);
    fputc('\n', pipe);
    int status = VOICEATC_PCLOSE(pipe);

    if (written != text.size()) {
        if (err) *err = "TTS command closed its input early: " + cmd;
        return false;
    }
    if (status != 0) {
        if (err) *err = "TTS command exited with status " + std::to_string(status) + ": " + cmd;
        return false;
    }
    return true;
}

// =========================================================
// Playback
// =========================================================
bool TtsSynthesizer::play(const std::string& wavPath, std::string* err) {
    sf::SoundBuffer buffer;
    if (!buffer.loadFromFile(wavPath)) {
        if (err) *err = "could not load rendered audio: " + wavPath;
        return false;
    }

    sf::Sound sound(buffer);
    sound.setVolume(100.f);
    sound.play();

    LOG_DEBUG("Voice/Audio", "Playing: " + wavPath +
        " (duration=" + std::to_string(buffer.getDuration().asSeconds()) + "s)");

    // Blocks until done so phrases never overlap or reorder
    while (sound.getStatus() == sf::SoundSource::Status::Playing) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

// =========================================================
// High-level Speak
// =========================================================
bool TtsSynthesizer::speak(const std::string& text, std::string* err) {
    std::error_code ec;
    fs::create_directories(outputDir_, ec);
    if (ec) {
        if (err) *err = "could not create " + outputDir_.string() + ": " + ec.message();
        return false;
    }

    std::string wavPath = (outputDir_ / (randomString(32) + ".wav")).string();

    bool ok = render(text, wavPath, err) && play(wavPath, err);

    fs::remove(wavPath, ec);
    if (ok) {
        LOG_INFO("Voice", "Spoke: " + text);
    }
    return ok;
}

} // namespace Voice
