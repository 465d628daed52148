#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lore::search {

/**
 * @brief Inflection rules used to map declined name forms back to their base.
 *
 * Suffixes and alternations operate on case-folded UTF-8. Suffixes are kept ordered
 * longest first so the most specific ending is stripped.
 */
struct MorphologyRules {
    std::vector<std::string> suffixes;
    // (inflected ending, base ending), e.g. ("dzie", "d"): "Rolandzie" -> "Roland"
    std::vector<std::pair<std::string, std::string>> alternations;
    // In code points; stripping never leaves a shorter stem
    std::size_t minStemLength = 3;

    // Polish noun declension endings and consonant alternations
    static MorphologyRules polish();

    // Restore the longest-first ordering after editing `suffixes`
    void normalize();
};

/**
 * @brief Strip the longest matching suffix from a folded word.
 * @return The stem, or nullopt when no suffix matches or the stem would be too short.
 */
std::optional<std::string> stripSuffix(std::string_view word, const MorphologyRules& rules);

// Stem of a word, or the word itself when nothing can be stripped
std::string stemWord(std::string_view word, const MorphologyRules& rules);

// Stems every whitespace-separated word of a folded phrase
std::string stemPhrase(std::string_view phrase, const MorphologyRules& rules);

/**
 * @brief Base-form candidates for a folded query, one per matching alternation rule.
 */
std::vector<std::string> alternationCandidates(std::string_view word,
                                               const MorphologyRules& rules);

} // namespace lore::search
