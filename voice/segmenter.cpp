#include "segmenter.hpp"
#include "logger.hpp"

#include <string>

namespace Voice {

SegmentEvent Segmenter::push(const std::vector<float>& chunk, bool silent) {
    if (silent && !inSpeech_) return SegmentEvent::None;

    if (!silent) {
        if (!inSpeech_) LOG_TRACE("Voice", "Speech started");
        inSpeech_ = true;
        silenceMs_ = 0;
        speechMs_ += limits_.chunkMs;
    } else {
        silenceMs_ += limits_.chunkMs;
    }
    samples_.insert(samples_.end(), chunk.begin(), chunk.end());
    lengthMs_ += limits_.chunkMs;

    bool ended = silent && silenceMs_ >= limits_.minSilenceMs;
    if (!ended && lengthMs_ >= limits_.maxSegmentMs) {
        LOG_DEBUG("Voice", "Segment reached max length, cutting");
        ended = true;
    }
    if (!ended) return SegmentEvent::None;

    if (speechMs_ < limits_.minSpeechMs) {
        LOG_TRACE("Voice", "Discarding " + std::to_string(speechMs_) + " ms blip");
        return SegmentEvent::Discarded;
    }
    return SegmentEvent::Complete;
}

void Segmenter::reset() {
    samples_.clear();
    speechMs_ = 0;
    silenceMs_ = 0;
    lengthMs_ = 0;
    inSpeech_ = false;
}

} // namespace Voice
