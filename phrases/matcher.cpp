#include "matcher.hpp"

#include <algorithm>
#include <cctype>

namespace Phrases {

MatchResult MatchResult::hit(const CanonicalPhrase& phrase, const std::string& variant) {
    MatchResult r;
    r.matched       = true;
    r.canonicalText = phrase.canonicalText;
    r.phraseId      = phrase.id;
    r.variant       = variant;
    return r;
}

std::string foldCase(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string normalizeFragment(const std::string& text) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };

    auto first = std::find_if(text.begin(), text.end(), notSpace);
    if (first == text.end()) return {};
    auto last = std::find_if(text.rbegin(), text.rend(), notSpace).base();

    return foldCase(std::string(first, last));
}

static bool overlaps(const std::string& fragment, const std::string& variant) {
    return fragment.find(variant) != std::string::npos ||
           variant.find(fragment) != std::string::npos;
}

MatchResult match(const std::string& fragmentText, const MappingTable& table) {
    const std::string fragment = normalizeFragment(fragmentText);

    // "" is a substring of everything
    if (fragment.empty()) return MatchResult::noMatch();

    for (const auto& phrase : table.phrases()) {
        for (const auto& variant : phrase.variants) {
            if (overlaps(fragment, foldCase(variant))) {
                return MatchResult::hit(phrase, variant);
            }
        }
    }

    return MatchResult::noMatch();
}

} // namespace Phrases
