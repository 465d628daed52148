#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace lore::common {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

inline std::string trimmed(std::string_view sv) {
    std::string s(sv);
    trim(s);
    return s;
}

/**
 * @brief Decode UTF-8 into code points.
 *
 * Invalid sequences decode byte-by-byte so that distance computations stay total.
 */
std::u32string decodeUtf8(std::string_view text);

/**
 * @brief Encode code points back into UTF-8.
 */
std::string encodeUtf8(std::u32string_view text);

/**
 * @brief Number of code points in a UTF-8 string.
 */
std::size_t codePointLength(std::string_view text);

/**
 * @brief Case-fold a UTF-8 string for name comparison.
 *
 * Folds ASCII, Latin-1 and Latin Extended-A (which covers the Polish alphabet).
 */
std::string foldCase(std::string_view text);

// Case-insensitive equality on folded forms
bool equalsFolded(std::string_view a, std::string_view b);

// Split on ASCII whitespace, dropping empty pieces
std::vector<std::string> splitWhitespace(std::string_view text);

// Split on a delimiter, trimming each piece and dropping empty ones
std::vector<std::string> splitList(std::string_view text, char delimiter);

// Strip leading/trailing ASCII punctuation (quotes, commas, brackets...)
std::string trimPunctuation(std::string_view text);

// True when `text` ends with `suffix` (byte-wise)
inline bool endsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Case-insensitive, insertion-ordered set of names.
 */
class NameSet {
public:
    // Returns false when an equal (folded) name is already present
    bool insert(std::string_view name);
    bool contains(std::string_view name) const;

    const std::vector<std::string>& values() const { return values_; }
    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }

private:
    std::vector<std::string> values_;
    std::vector<std::string> folded_;
};

} // namespace lore::common
