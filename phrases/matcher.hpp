#pragma once
#include <string>
#include "phrase_map.hpp"

namespace Phrases {

// Outcome of matching one fragment. NoMatch is a normal outcome, not an error.
struct MatchResult {
    bool matched = false;
    std::string canonicalText;   // what to speak
    std::string phraseId;        // which table entry
    std::string variant;         // the variant that hit, as written in the table

    static MatchResult noMatch() { return {}; }
    static MatchResult hit(const CanonicalPhrase& phrase, const std::string& variant);
};

// ASCII case folding; other bytes pass through unchanged, so non-ASCII
// letters compare case-sensitively.
std::string foldCase(const std::string& text);

// Trim surrounding whitespace, then fold case.
std::string normalizeFragment(const std::string& text);

// Map a recognized fragment onto the table.
//
// A variant matches when its folded form is contained in the normalized
// fragment or the normalized fragment is contained in it. Phrases are tried in
// table order and variants in listed order; the first hit wins. Blank
// fragments never match.
//
// Pure: no I/O, no state.
MatchResult match(const std::string& fragmentText, const MappingTable& table);

} // namespace Phrases
