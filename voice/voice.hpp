#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "recognizer.hpp"
#include "bootstrap_config.hpp"
#include "error_manager.hpp"

// Forward declare
struct whisper_context;
typedef void PaStream;

namespace Voice {

// Microphone recognizer: PortAudio capture, RMS voice-activity segmentation,
// whisper.cpp transcription of each speech segment into one fragment.
class WhisperRecognizer : public Recognizer {
public:
    explicit WhisperRecognizer(const AppConfig& cfg);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    // Load the model and start the microphone stream.
    StageResult open();

    RecognizerStatus nextFragment(std::string& text, std::string* err = nullptr) override;
    void cancel() override { cancelled_.store(true); }
    std::string name() const override;

    struct AudioData {
        std::vector<float> buffer;
        std::mutex mtx;
        std::size_t maxSamples = 0;   // oldest samples dropped beyond this
        std::size_t dropped = 0;
    };

private:
    bool isSilence(const std::vector<float>& pcm) const;
    bool transcribe(const std::vector<float>& pcm, std::string& out, std::string* err);
    void close();

    AppConfig cfg_;
    whisper_context* ctx_ = nullptr;
    PaStream* stream_ = nullptr;
    bool paInitialized_ = false;
    std::string deviceName_;

    AudioData audio_;
    std::atomic<bool> cancelled_{false};
};

} // namespace Voice
