// =============================================================================
// Transcript Cleanup and TTS Command Tests
// =============================================================================

#include <gtest/gtest.h>
#include "voice/transcript.hpp"
#include "voice/tts_command.hpp"
#include "voice/synthesizer.hpp"

#include <sstream>

using namespace Voice;

// ------------------------------------------------------------
// cleanTranscript
// ------------------------------------------------------------
TEST(TranscriptTest, DropsAnnotations) {
    EXPECT_EQ(cleanTranscript("[BLANK_AUDIO]"), "");
    EXPECT_EQ(cleanTranscript(" (static) cleared to land [noise]"), "cleared to land");
    EXPECT_EQ(cleanTranscript("*cough* go around"), "go around");
}

TEST(TranscriptTest, CollapsesWhitespaceAndTrailingPunctuation) {
    EXPECT_EQ(cleanTranscript("  Cleared   to\tland.  "), "Cleared to land");
    EXPECT_EQ(cleanTranscript("Say again?!"), "Say again");
    EXPECT_EQ(cleanTranscript("Roger, "), "Roger");
}

TEST(TranscriptTest, KeepsCaseAndInnerPunctuation) {
    EXPECT_EQ(cleanTranscript("Line up, and wait"), "Line up, and wait");
}

// Unclosed brackets are speech, not annotations
TEST(TranscriptTest, UnclosedBracketKept) {
    EXPECT_EQ(cleanTranscript("runway (two seven"), "runway (two seven");
}

// ------------------------------------------------------------
// TTS command
// ------------------------------------------------------------
#ifndef _WIN32
TEST(TtsCommandTest, ShellQuote) {
    EXPECT_EQ(shellQuote("en-us"), "'en-us'");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(shellQuote(""), "''");
}

TEST(TtsCommandTest, ExpandsPlaceholders) {
    EXPECT_EQ(expandTtsCommand("espeak-ng --stdin -v {voice} -w {out}", "en-us", "/tmp/tts out/a.wav"),
              "espeak-ng --stdin -v 'en-us' -w '/tmp/tts out/a.wav'");
}

TEST(TtsCommandTest, RepeatedAndUnknownPlaceholders) {
    EXPECT_EQ(expandTtsCommand("{out} {speed} {out}", "v", "x.wav"), "'x.wav' {speed} 'x.wav'");
}

// The voice name cannot break out of its argument
TEST(TtsCommandTest, VoiceCannotInjectCommands) {
    std::string cmd = expandTtsCommand("tts -v {voice} -o {out}", "en; rm -rf /", "a.wav");
    EXPECT_EQ(cmd, "tts -v 'en; rm -rf /' -o 'a.wav'");
}
#endif

// ------------------------------------------------------------
// ConsoleSynthesizer
// ------------------------------------------------------------
TEST(ConsoleSynthesizerTest, PrintsOneLinePerPhrase) {
    std::ostringstream out;
    ConsoleSynthesizer synth(out);

    EXPECT_TRUE(synth.speak("Go around"));
    EXPECT_TRUE(synth.speak("Cleared to land runway two seven"));
    EXPECT_EQ(out.str(), "Go around\nCleared to land runway two seven\n");
    EXPECT_EQ(synth.name(), "console");
}
