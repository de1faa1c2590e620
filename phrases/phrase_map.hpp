#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace Phrases {

// One member of the controlled vocabulary.
struct CanonicalPhrase {
    std::string id;                      // unique across the table, e.g. "landing_clearance"
    std::string canonicalText;           // exactly what gets spoken
    std::vector<std::string> variants;   // accepted phrasings, in match order
};

// Ordered, immutable phrase table. Order is match precedence.
// Built once by loadMappingTable(); safe to share read-only across threads.
class MappingTable {
public:
    MappingTable() = default;
    explicit MappingTable(std::vector<CanonicalPhrase> phrases);

    const std::vector<CanonicalPhrase>& phrases() const { return phrases_; }
    std::size_t size() const { return phrases_.size(); }
    bool empty() const { return phrases_.empty(); }

    // nullptr if no phrase has this id
    const CanonicalPhrase* find(const std::string& id) const;

private:
    std::vector<CanonicalPhrase> phrases_;
    std::unordered_map<std::string, std::size_t> byId_;
};

using MappingTablePtr = std::shared_ptr<const MappingTable>;

// Lower-cased id derived from canonical text ("Cleared to land" -> "cleared_to_land").
std::string deriveId(const std::string& canonicalText);

// Load and validate a mapping document. All-or-nothing: on failure 'out' is
// left untouched and 'err' names the file and the offending entry.
bool loadMappingTable(const std::string& path,
                      MappingTablePtr& out,
                      std::string* err = nullptr);

bool loadMappingTableFromString(const std::string& jsonText,
                                MappingTablePtr& out,
                                std::string* err = nullptr);

} // namespace Phrases
