#include "voice.hpp"
#include "transcript.hpp"
#include "segmenter.hpp"
#include "logger.hpp"

#include <whisper.h>
#include <portaudio.h>
#include <cmath>

namespace Voice {

// Segmentation works on half-second chunks
static constexpr int kChunkMs = 500;
static constexpr int kPollMs = 50;
// Capture backlog kept while the session is busy speaking
static constexpr int kMaxBacklogSeconds = 30;

// ============================================================
// PortAudio Helpers
// ============================================================
static int recordCallback(const void* input,
                          void* /*output*/,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo*,
                          PaStreamCallbackFlags,
                          void* userData) {
    auto* data = reinterpret_cast<WhisperRecognizer::AudioData*>(userData);
    const float* in = reinterpret_cast<const float*>(input);
    if (in) {
        std::lock_guard<std::mutex> lock(data->mtx);
        data->buffer.insert(data->buffer.end(), in, in + frameCount);
        if (data->maxSamples > 0 && data->buffer.size() > data->maxSamples) {
            std::size_t excess = data->buffer.size() - data->maxSamples;
            data->buffer.erase(data->buffer.begin(), data->buffer.begin() + excess);
            data->dropped += excess;
        }
    }
    return paContinue;
}

static std::string paError(const std::string& what, PaError err) {
    return what + ": " + Pa_GetErrorText(err);
}

// ============================================================
// Lifecycle
// ============================================================
WhisperRecognizer::WhisperRecognizer(const AppConfig& cfg) : cfg_(cfg) {
    audio_.maxSamples = static_cast<std::size_t>(cfg_.sampleRate) * kMaxBacklogSeconds;
}

WhisperRecognizer::~WhisperRecognizer() {
    close();
}

std::string WhisperRecognizer::name() const {
    return deviceName_.empty() ? "whisper" : "whisper@" + deviceName_;
}

StageResult WhisperRecognizer::open() {
    if (cfg_.sampleRate != WHISPER_SAMPLE_RATE) {
        return ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_PARSE",
                                    "audio.sample_rate must be " +
                                    std::to_string(WHISPER_SAMPLE_RATE) + " for whisper input");
    }

    // ---------------- Whisper model ----------------
    LOG_DEBUG("Voice", "Loading Whisper model: " + cfg_.modelPath.string());

    whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(cfg_.modelPath.string().c_str(), cparams);
    if (!ctx_) {
        LOG_PHASE("Whisper model load", false);
        return ErrorManager::report(ErrorKind::ResourceUnavailable, "ERR_MODEL_LOAD_FAILED",
                                    cfg_.modelPath.string());
    }
    LOG_PHASE("Whisper model load", true);

    // ---------------- PortAudio ----------------
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return ErrorManager::report(ErrorKind::ResourceUnavailable, "ERR_AUDIO_DEVICE",
                                    paError("Pa_Initialize", err));
    }
    paInitialized_ = true;

    int deviceIndex = (cfg_.inputDeviceIndex >= 0)
                        ? cfg_.inputDeviceIndex
                        : Pa_GetDefaultInputDevice();

    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        return ErrorManager::report(ErrorKind::ResourceUnavailable, "ERR_AUDIO_DEVICE",
                                    "no input device #" + std::to_string(cfg_.inputDeviceIndex) +
                                    " (see --list-devices)");
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
    if (!devInfo || devInfo->maxInputChannels < 1) {
        return ErrorManager::report(ErrorKind::ResourceUnavailable, "ERR_AUDIO_DEVICE",
                                    "device #" + std::to_string(deviceIndex) + " has no input channels");
    }
    deviceName_ = devInfo->name;
    LOG_DEBUG("Voice", "Using input device #" + std::to_string(deviceIndex) + " (" + deviceName_ + ")");

    PaStreamParameters inputParams;
    inputParams.device = deviceIndex;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(&stream_, &inputParams, nullptr,
                        cfg_.sampleRate,
                        static_cast<unsigned long>(cfg_.framesPerBuffer),
                        paNoFlag, recordCallback, &audio_);
    if (err != paNoError || !stream_) {
        stream_ = nullptr;
        return ErrorManager::report(ErrorKind::ResourceUnavailable, "ERR_AUDIO_DEVICE",
                                    paError("Pa_OpenStream on " + deviceName_, err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        return ErrorManager::report(ErrorKind::ResourceUnavailable, "ERR_AUDIO_DEVICE",
                                    paError("Pa_StartStream on " + deviceName_, err));
    }

    LOG_PHASE("Microphone stream start", true);
    return StageResult::ok();
}

void WhisperRecognizer::close() {
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        LOG_DEBUG("Voice", "Stream stopped");
    }
    if (paInitialized_) {
        Pa_Terminate();
        paInitialized_ = false;
    }
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

// ============================================================
// Silence Detection
// ============================================================
bool WhisperRecognizer::isSilence(const std::vector<float>& pcm) const {
    if (pcm.empty()) return true;
    double energy = 0.0;
    for (float s : pcm) energy += s * s;
    energy /= pcm.size();
    double rms = std::sqrt(energy);
    return rms < cfg_.silenceThreshold;
}

// ============================================================
// Whisper decode
// ============================================================
bool WhisperRecognizer::transcribe(const std::vector<float>& pcm, std::string& out, std::string* err) {
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.no_context       = true;
    wparams.single_segment   = false;
    wparams.no_timestamps    = true;
    wparams.language         = cfg_.whisperLanguage.c_str();
    wparams.n_threads        = cfg_.whisperThreads;

    if (whisper_full(ctx_, wparams, pcm.data(), static_cast<int>(pcm.size())) != 0) {
        if (err) *err = "whisper_full failed on " + std::to_string(pcm.size()) + " samples";
        return false;
    }

    std::string transcript;
    int n = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n; i++) {
        transcript += whisper_full_get_segment_text(ctx_, i);
        transcript += " ";
    }
    out = cleanTranscript(transcript);
    return true;
}

// ============================================================
// Voice Input (Speech → Text), one segment per call
// ============================================================
RecognizerStatus WhisperRecognizer::nextFragment(std::string& text, std::string* err) {
    if (!ctx_ || !stream_) {
        if (err) *err = "recognizer not open";
        return RecognizerStatus::Failed;
    }

    const std::size_t chunkSamples =
        static_cast<std::size_t>(cfg_.sampleRate) * kChunkMs / 1000;

    SegmentLimits limits;
    limits.chunkMs = kChunkMs;
    limits.minSpeechMs = cfg_.minSpeechMs;
    limits.minSilenceMs = cfg_.minSilenceMs;
    limits.maxSegmentMs = cfg_.maxSegmentMs;
    Segmenter segmenter(limits);

    while (true) {
        if (cancelled_.load()) return RecognizerStatus::Cancelled;

        if (Pa_IsStreamActive(stream_) != 1) {
            if (err) *err = "microphone stream on " + deviceName_ + " is no longer active";
            return RecognizerStatus::Failed;
        }

        std::vector<float> chunk;
        {
            std::lock_guard<std::mutex> lock(audio_.mtx);
            if (audio_.dropped > 0) {
                LOG_WARN("Voice", "Dropped " + std::to_string(audio_.dropped) +
                                  " backlog samples while busy");
                audio_.dropped = 0;
            }
            if (audio_.buffer.size() >= chunkSamples) {
                chunk.assign(audio_.buffer.begin(), audio_.buffer.begin() + chunkSamples);
                audio_.buffer.erase(audio_.buffer.begin(), audio_.buffer.begin() + chunkSamples);
            }
        }

        if (chunk.empty()) {
            Pa_Sleep(kPollMs);
            continue;
        }

        SegmentEvent event = segmenter.push(chunk, isSilence(chunk));
        if (event == SegmentEvent::None) continue;

        if (event == SegmentEvent::Complete) {
            std::string transcript;
            if (!transcribe(segmenter.samples(), transcript, err)) {
                return RecognizerStatus::Failed;
            }
            if (!transcript.empty()) {
                LOG_DEBUG("Voice", "Heard \"" + transcript + "\"");
                text = transcript;
                return RecognizerStatus::Fragment;
            }
            LOG_TRACE("Voice", "Segment decoded to no speech");
        }
        segmenter.reset();
    }
}

} // namespace Voice
