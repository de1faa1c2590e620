#pragma once
#include <vector>

namespace Voice {

struct SegmentLimits {
    int chunkMs = 500;
    int minSpeechMs = 500;
    int minSilenceMs = 1200;
    int maxSegmentMs = 15000;
};

enum class SegmentEvent {
    None,       // keep feeding
    Complete,   // samples() holds a segment worth decoding
    Discarded   // ended below minSpeechMs
};

// Voice-activity segmentation over fixed-size chunks. Leading silence is
// dropped; once speech starts every chunk is kept until minSilenceMs of
// trailing silence or maxSegmentMs of total length, gaps included.
// After Complete or Discarded, read samples() and call reset().
class Segmenter {
public:
    explicit Segmenter(const SegmentLimits& limits) : limits_(limits) {}

    SegmentEvent push(const std::vector<float>& chunk, bool silent);
    void reset();

    const std::vector<float>& samples() const { return samples_; }
    int speechMs() const { return speechMs_; }
    int lengthMs() const { return lengthMs_; }
    bool inSpeech() const { return inSpeech_; }

private:
    SegmentLimits limits_;
    std::vector<float> samples_;
    int speechMs_ = 0;
    int silenceMs_ = 0;
    int lengthMs_ = 0;
    bool inSpeech_ = false;
};

} // namespace Voice
