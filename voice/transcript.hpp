#pragma once
#include <string>

namespace Voice {

// Turn raw decoder output into a fragment:
//  - drops non-speech annotations: "[BLANK_AUDIO]", "(static)", "*cough*"
//  - collapses runs of whitespace
//  - strips trailing sentence punctuation and surrounding whitespace
// Case and inner punctuation are kept; the matcher owns case folding.
std::string cleanTranscript(const std::string& raw);

} // namespace Voice
