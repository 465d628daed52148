#include <lore/common/text_utils.h>

namespace lore::common {

namespace {

char32_t foldCodePoint(char32_t cp) {
    if (cp < 0x80) {
        return static_cast<char32_t>(std::tolower(static_cast<int>(cp)));
    }
    // Latin-1 supplement: À..Þ except ×
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
        return cp + 0x20;
    }
    // Latin Extended-A alternates upper/lower; the parity flips at U+0138 and U+0178
    if ((cp >= 0x0100 && cp <= 0x0137) || (cp >= 0x014A && cp <= 0x0177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp == 0x0178) {
        return 0xFF;
    }
    return cp;
}

} // namespace

std::u32string decodeUtf8(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        std::size_t len = 1;
        char32_t cp = c;
        if (c >= 0xF0 && c <= 0xF7) {
            len = 4;
            cp = c & 0x07;
        } else if (c >= 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if (c >= 0xC0) {
            len = 2;
            cp = c & 0x1F;
        }

        bool valid = len == 1 || i + len <= text.size();
        for (std::size_t k = 1; valid && k < len; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!valid) {
            out.push_back(c);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::string encodeUtf8(std::u32string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

std::size_t codePointLength(std::string_view text) {
    std::size_t n = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

std::string foldCase(std::string_view text) {
    auto cps = decodeUtf8(text);
    for (auto& cp : cps) {
        cp = foldCodePoint(cp);
    }
    return encodeUtf8(cps);
}

bool equalsFolded(std::string_view a, std::string_view b) {
    return foldCase(a) == foldCase(b);
}

std::vector<std::string> splitWhitespace(std::string_view text) {
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        const std::size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i > start) {
            parts.emplace_back(text.substr(start, i - start));
        }
    }
    return parts;
}

std::vector<std::string> splitList(std::string_view text, char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            pos = text.size();
        }
        auto piece = trimmed(text.substr(start, pos - start));
        if (!piece.empty()) {
            parts.push_back(std::move(piece));
        }
        start = pos + 1;
    }
    return parts;
}

std::string trimPunctuation(std::string_view text) {
    auto isPunct = [](unsigned char c) { return c < 0x80 && std::ispunct(c) != 0; };
    std::size_t l = 0;
    std::size_t r = text.size();
    while (l < r && isPunct(static_cast<unsigned char>(text[l]))) {
        ++l;
    }
    while (r > l && isPunct(static_cast<unsigned char>(text[r - 1]))) {
        --r;
    }
    return std::string(text.substr(l, r - l));
}

bool NameSet::insert(std::string_view name) {
    auto folded = foldCase(name);
    if (std::find(folded_.begin(), folded_.end(), folded) != folded_.end()) {
        return false;
    }
    values_.emplace_back(name);
    folded_.push_back(std::move(folded));
    return true;
}

bool NameSet::contains(std::string_view name) const {
    const auto folded = foldCase(name);
    return std::find(folded_.begin(), folded_.end(), folded) != folded_.end();
}

} // namespace lore::common
