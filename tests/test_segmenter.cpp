// =============================================================================
// Speech Segmentation Tests
// =============================================================================

#include <gtest/gtest.h>
#include "voice/segmenter.hpp"

#include <vector>

using namespace Voice;

class SegmenterTest : public ::testing::Test {
protected:
    void SetUp() override {
        limits.chunkMs = 500;
        limits.minSpeechMs = 1000;
        limits.minSilenceMs = 1000;
        limits.maxSegmentMs = 3000;
    }

    // Four samples per chunk are enough to count what was kept
    static std::vector<float> chunk(float value) { return std::vector<float>(4, value); }

    SegmentLimits limits;
};

TEST_F(SegmenterTest, LeadingSilenceIsDropped) {
    Segmenter seg(limits);
    EXPECT_EQ(seg.push(chunk(0.0f), true), SegmentEvent::None);
    EXPECT_EQ(seg.push(chunk(0.0f), true), SegmentEvent::None);
    EXPECT_FALSE(seg.inSpeech());
    EXPECT_TRUE(seg.samples().empty());
    EXPECT_EQ(seg.lengthMs(), 0);
}

TEST_F(SegmenterTest, TrailingSilenceCompletesSegment) {
    Segmenter seg(limits);
    EXPECT_EQ(seg.push(chunk(0.5f), false), SegmentEvent::None);
    EXPECT_EQ(seg.push(chunk(0.5f), false), SegmentEvent::None);
    EXPECT_EQ(seg.push(chunk(0.0f), true), SegmentEvent::None);
    EXPECT_EQ(seg.push(chunk(0.0f), true), SegmentEvent::Complete);

    EXPECT_EQ(seg.speechMs(), 1000);
    EXPECT_EQ(seg.lengthMs(), 2000);
    EXPECT_EQ(seg.samples().size(), 16u);
}

TEST_F(SegmenterTest, ShortBlipIsDiscarded) {
    Segmenter seg(limits);
    seg.push(chunk(0.5f), false);
    seg.push(chunk(0.0f), true);
    EXPECT_EQ(seg.push(chunk(0.0f), true), SegmentEvent::Discarded);

    seg.reset();
    EXPECT_FALSE(seg.inSpeech());
    EXPECT_TRUE(seg.samples().empty());
}

// Short pauses between words count toward the length cap
TEST_F(SegmenterTest, PausesCountTowardMaxLength) {
    Segmenter seg(limits);
    for (int i = 0; i < 2; ++i) {
        EXPECT_EQ(seg.push(chunk(0.5f), false), SegmentEvent::None);
        EXPECT_EQ(seg.push(chunk(0.0f), true), SegmentEvent::None);
    }
    EXPECT_EQ(seg.push(chunk(0.5f), false), SegmentEvent::None);
    EXPECT_EQ(seg.push(chunk(0.0f), true), SegmentEvent::Complete);

    EXPECT_EQ(seg.lengthMs(), 3000);
    EXPECT_EQ(seg.speechMs(), 1500);
    EXPECT_EQ(seg.samples().size(), 24u);
}

TEST_F(SegmenterTest, ContinuousSpeechIsCut) {
    Segmenter seg(limits);
    SegmentEvent last = SegmentEvent::None;
    int pushes = 0;
    while (last == SegmentEvent::None && pushes < 20) {
        last = seg.push(chunk(0.5f), false);
        ++pushes;
    }
    EXPECT_EQ(last, SegmentEvent::Complete);
    EXPECT_EQ(pushes, 6);
}
