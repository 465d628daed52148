#include <lore/common/text_utils.h>
#include <lore/search/morphology.h>

#include <algorithm>

namespace lore::search {

MorphologyRules MorphologyRules::polish() {
    MorphologyRules rules;
    rules.suffixes = {"owie", "ami", "ach", "ego", "emu", "owi", "ów", "om", "em",
                      "ie",   "ą",   "ę",   "a",   "u",   "y",   "i",  "e",  "o"};
    rules.alternations = {
        {"ździe", "zd"}, {"ście", "st"}, {"dzie", "d"}, {"rze", "r"}, {"cie", "t"},
        {"dze", "g"},    {"ce", "k"},    {"le", "ł"},   {"sie", "s"}, {"zie", "z"},
        {"nie", "n"},    {"mie", "m"},   {"wie", "w"},  {"bie", "b"}, {"pie", "p"},
    };
    rules.normalize();
    return rules;
}

void MorphologyRules::normalize() {
    std::stable_sort(suffixes.begin(), suffixes.end(), [](const auto& a, const auto& b) {
        return common::codePointLength(a) > common::codePointLength(b);
    });
    std::stable_sort(alternations.begin(), alternations.end(), [](const auto& a, const auto& b) {
        return common::codePointLength(a.first) > common::codePointLength(b.first);
    });
}

std::optional<std::string> stripSuffix(std::string_view word, const MorphologyRules& rules) {
    const auto wordLength = common::codePointLength(word);
    for (const auto& suffix : rules.suffixes) {
        if (!common::endsWith(word, suffix)) {
            continue;
        }
        const auto stem = word.substr(0, word.size() - suffix.size());
        if (wordLength - common::codePointLength(suffix) >= rules.minStemLength) {
            return std::string(stem);
        }
    }
    return std::nullopt;
}

std::string stemWord(std::string_view word, const MorphologyRules& rules) {
    if (auto stem = stripSuffix(word, rules)) {
        return *stem;
    }
    return std::string(word);
}

std::string stemPhrase(std::string_view phrase, const MorphologyRules& rules) {
    std::string out;
    for (const auto& word : common::splitWhitespace(phrase)) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += stemWord(word, rules);
    }
    return out;
}

std::vector<std::string> alternationCandidates(std::string_view word,
                                               const MorphologyRules& rules) {
    std::vector<std::string> candidates;
    const auto wordLength = common::codePointLength(word);
    for (const auto& [inflected, base] : rules.alternations) {
        if (!common::endsWith(word, inflected)) {
            continue;
        }
        const auto stemLength =
            wordLength - common::codePointLength(inflected) + common::codePointLength(base);
        if (stemLength < rules.minStemLength) {
            continue;
        }
        auto candidate = std::string(word.substr(0, word.size() - inflected.size())) + base;
        if (std::find(candidates.begin(), candidates.end(), candidate) == candidates.end()) {
            candidates.push_back(std::move(candidate));
        }
    }
    return candidates;
}

} // namespace lore::search
