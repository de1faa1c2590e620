#include "phrase_map.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace Phrases {

// Variants this short overlap with most fragments under bidirectional containment
static constexpr std::size_t kShortVariantWarnLength = 2;

// ------------------------------------------------------------
// MappingTable
// ------------------------------------------------------------
MappingTable::MappingTable(std::vector<CanonicalPhrase> phrases)
    : phrases_(std::move(phrases)) {
    for (std::size_t i = 0; i < phrases_.size(); i++) {
        byId_.emplace(phrases_[i].id, i);
    }
}

const CanonicalPhrase* MappingTable::find(const std::string& id) const {
    auto it = byId_.find(id);
    return it == byId_.end() ? nullptr : &phrases_[it->second];
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string deriveId(const std::string& canonicalText) {
    std::string id;
    bool pendingSep = false;
    for (unsigned char c : canonicalText) {
        if (std::isalnum(c)) {
            if (pendingSep && !id.empty()) id.push_back('_');
            id.push_back(static_cast<char>(std::tolower(c)));
            pendingSep = false;
        } else {
            pendingSep = true;
        }
    }
    return id;
}

static std::string entryLabel(std::size_t index) {
    return "entry #" + std::to_string(index);
}

// Throws std::runtime_error with a message naming the bad entry
static CanonicalPhrase parseEntry(const nlohmann::json& e, std::size_t index) {
    if (!e.is_object()) {
        throw std::runtime_error(entryLabel(index) + " is not an object");
    }

    CanonicalPhrase phrase;

    const char* canonicalKey = e.contains("canonical") ? "canonical" : "canonical_text";
    if (!e.contains(canonicalKey) || !e[canonicalKey].is_string()) {
        throw std::runtime_error(entryLabel(index) + " has no string \"canonical\" field");
    }
    phrase.canonicalText = e[canonicalKey].get<std::string>();
    if (isBlank(phrase.canonicalText)) {
        throw std::runtime_error(entryLabel(index) + " has empty canonical text");
    }

    if (!e.contains("variants") || !e["variants"].is_array()) {
        throw std::runtime_error(entryLabel(index) + " (" + phrase.canonicalText +
                                 ") has no \"variants\" array");
    }
    const auto& variants = e["variants"];
    if (variants.empty()) {
        throw std::runtime_error(entryLabel(index) + " (" + phrase.canonicalText +
                                 ") has an empty variants list");
    }
    for (std::size_t v = 0; v < variants.size(); v++) {
        if (!variants[v].is_string()) {
            throw std::runtime_error(entryLabel(index) + " variant #" + std::to_string(v) +
                                     " is not a string");
        }
        std::string variant = variants[v].get<std::string>();
        if (isBlank(variant)) {
            throw std::runtime_error(entryLabel(index) + " variant #" + std::to_string(v) +
                                     " is blank");
        }
        phrase.variants.push_back(std::move(variant));
    }

    if (e.contains("id")) {
        if (!e["id"].is_string() || isBlank(e["id"].get<std::string>())) {
            throw std::runtime_error(entryLabel(index) + " has a non-string or blank \"id\"");
        }
        phrase.id = e["id"].get<std::string>();
    } else {
        phrase.id = deriveId(phrase.canonicalText);
        if (phrase.id.empty()) {
            throw std::runtime_error(entryLabel(index) +
                                     " needs an explicit \"id\" (canonical text has no letters or digits)");
        }
    }

    return phrase;
}

static MappingTablePtr buildTable(const nlohmann::json& doc) {
    const nlohmann::json* entries = nullptr;
    if (doc.is_array()) {
        entries = &doc;
    } else if (doc.is_object() && doc.contains("mappings") && doc["mappings"].is_array()) {
        entries = &doc["mappings"];
    } else {
        throw std::runtime_error("expected an array or an object with a \"mappings\" array");
    }

    if (entries->empty()) {
        throw std::runtime_error("no phrase entries");
    }

    std::vector<CanonicalPhrase> phrases;
    phrases.reserve(entries->size());
    std::unordered_map<std::string, std::size_t> seen;

    for (std::size_t i = 0; i < entries->size(); i++) {
        CanonicalPhrase phrase = parseEntry((*entries)[i], i);

        auto [it, inserted] = seen.emplace(phrase.id, i);
        if (!inserted) {
            throw std::runtime_error(entryLabel(i) + " reuses id \"" + phrase.id +
                                     "\" from " + entryLabel(it->second));
        }

        for (const auto& v : phrase.variants) {
            if (v.size() <= kShortVariantWarnLength) {
                LOG_WARN("Phrases", "Variant \"" + v + "\" of " + phrase.id +
                                    " is very short and may match unrelated fragments");
            }
        }

        phrases.push_back(std::move(phrase));
    }

    return std::make_shared<const MappingTable>(std::move(phrases));
}

// ------------------------------------------------------------
// Load from a JSON string
// ------------------------------------------------------------
bool loadMappingTableFromString(const std::string& jsonText,
                                MappingTablePtr& out,
                                std::string* err) {
    try {
        nlohmann::json doc = nlohmann::json::parse(jsonText);
        MappingTablePtr table = buildTable(doc);
        LOG_DEBUG("Phrases", "Loaded " + std::to_string(table->size()) + " phrases from string");
        out = std::move(table);
        return true;
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}

// ------------------------------------------------------------
// Load from file
// ------------------------------------------------------------
bool loadMappingTable(const std::string& path,
                      MappingTablePtr& out,
                      std::string* err) {
    std::ifstream f(path);
    if (!f) {
        if (err) *err = "Could not open file: " + path;
        return false;
    }

    try {
        nlohmann::json doc;
        f >> doc;
        MappingTablePtr table = buildTable(doc);
        LOG_INFO("Phrases", "Loaded " + std::to_string(table->size()) + " phrases from " + path);
        out = std::move(table);
        return true;
    } catch (const std::exception& e) {
        if (err) *err = path + ": " + e.what();
        return false;
    }
}

} // namespace Phrases
