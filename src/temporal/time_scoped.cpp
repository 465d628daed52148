#include <spdlog/spdlog.h>
#include <lore/common/text_utils.h>
#include <lore/temporal/time_scoped.h>

#include <charconv>
#include <chrono>
#include <format>

namespace lore::temporal {

namespace {

// Parses 1..maxDigits decimal digits starting at pos; advances pos
std::optional<int> readNumber(std::string_view s, std::size_t& pos, std::size_t minDigits,
                              std::size_t maxDigits) {
    const std::size_t start = pos;
    while (pos < s.size() && pos - start < maxDigits && s[pos] >= '0' && s[pos] <= '9') {
        ++pos;
    }
    if (pos - start < minDigits) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data() + start, s.data() + pos, value);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return value;
}

} // namespace

TimePoint makeDate(int year, unsigned month, unsigned day) {
    using namespace std::chrono;
    return sys_days{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
}

std::string formatDate(TimePoint tp) {
    using namespace std::chrono;
    const year_month_day ymd{floor<days>(tp)};
    return std::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

std::string formatRange(const std::optional<TimePoint>& from, const std::optional<TimePoint>& to) {
    return std::format("[{}..{}]", from ? formatDate(*from) : std::string("*"),
                       to ? formatDate(*to) : std::string("*"));
}

std::optional<TimePoint> parseDateBound(std::string_view fragment, BoundKind kind) {
    using namespace std::chrono;
    const auto text = common::trimmed(fragment);
    if (text.empty()) {
        return std::nullopt;
    }

    std::size_t pos = 0;
    auto y = readNumber(text, pos, 4, 4);
    if (!y) {
        return std::nullopt;
    }

    std::optional<int> m;
    std::optional<int> d;
    if (pos < text.size()) {
        if (text[pos] != '-') {
            return std::nullopt;
        }
        ++pos;
        m = readNumber(text, pos, 1, 2);
        if (!m) {
            return std::nullopt;
        }
        if (pos < text.size()) {
            if (text[pos] != '-') {
                return std::nullopt;
            }
            ++pos;
            d = readNumber(text, pos, 1, 2);
            if (!d || pos != text.size()) {
                return std::nullopt;
            }
        }
    }

    const std::chrono::year yr{*y};
    if (m && (*m < 1 || *m > 12)) {
        return std::nullopt;
    }

    year_month_day ymd{};
    if (kind == BoundKind::Start) {
        ymd = yr / std::chrono::month{static_cast<unsigned>(m.value_or(1))} /
              std::chrono::day{static_cast<unsigned>(d.value_or(1))};
    } else if (d) {
        ymd = yr / std::chrono::month{static_cast<unsigned>(*m)} /
              std::chrono::day{static_cast<unsigned>(*d)};
    } else {
        const std::chrono::month mo{static_cast<unsigned>(m.value_or(12))};
        ymd = year_month_day{year_month_day_last{yr, month_day_last{mo}}};
    }

    if (!ymd.ok()) {
        return std::nullopt;
    }

    TimePoint tp = sys_days{ymd};
    if (kind == BoundKind::End) {
        tp += days{1};
        tp -= TimePoint::duration{1};
    }
    return tp;
}

Result<TimePoint> parseInstant(std::string_view text) {
    auto tp = parseDateBound(text, BoundKind::Start);
    if (!tp) {
        return Error{ErrorCode::ParseError,
                     std::format("cannot parse date '{}', expected YYYY[-MM[-DD]]", text)};
    }
    return *tp;
}

ScopedText parseScopedValue(std::string_view raw) {
    ScopedText out;
    auto text = common::trimmed(raw);

    if (text.empty() || text.back() != ')') {
        out.text = std::move(text);
        return out;
    }

    const auto open = text.rfind('(');
    if (open == std::string::npos) {
        out.text = std::move(text);
        return out;
    }

    const std::string_view inner(text.data() + open + 1, text.size() - open - 2);
    const auto colon = inner.find(':');
    if (colon == std::string_view::npos) {
        out.text = std::move(text);
        return out;
    }

    out.hadRange = true;
    out.text = common::trimmed(std::string_view(text).substr(0, open));

    const auto startFragment = inner.substr(0, colon);
    const auto endFragment = inner.substr(colon + 1);
    out.validFrom = parseDateBound(startFragment, BoundKind::Start);
    out.validTo = parseDateBound(endFragment, BoundKind::End);

    if (!out.validFrom && !common::trimmed(startFragment).empty()) {
        spdlog::debug("Unparseable start date '{}' in '{}', treating as open", startFragment, raw);
    }
    if (!out.validTo && !common::trimmed(endFragment).empty()) {
        spdlog::debug("Unparseable end date '{}' in '{}', treating as open", endFragment, raw);
    }

    if (out.validFrom && out.validTo && *out.validFrom > *out.validTo) {
        spdlog::warn("Validity range {} of '{}' ends before it starts, ignoring range",
                     formatRange(out.validFrom, out.validTo), out.text);
        out.validFrom.reset();
        out.validTo.reset();
    }
    return out;
}

std::vector<std::string> activeValues(const History& history, std::optional<TimePoint> at) {
    common::NameSet seen;
    for (const auto* entry : allActive(history, at)) {
        seen.insert(entry->value);
    }
    return seen.values();
}

std::optional<std::string> activeValue(const History& history, std::optional<TimePoint> at) {
    if (const auto* entry = lastActive(history, at)) {
        return entry->value;
    }
    return std::nullopt;
}

} // namespace lore::temporal
