#pragma once

#include <lore/core/types.h>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lore::temporal {

/**
 * @brief A value paired with an optional validity range.
 *
 * A missing validFrom means active since the dawn of time, a missing validTo means active
 * indefinitely. Both bounds are inclusive.
 */
template <typename T> struct TimeScoped {
    T value{};
    std::optional<TimePoint> validFrom;
    std::optional<TimePoint> validTo;

    bool isActiveAt(std::optional<TimePoint> at) const {
        if (!at) {
            return true;
        }
        if (validFrom && *at < *validFrom) {
            return false;
        }
        if (validTo && *at > *validTo) {
            return false;
        }
        return true;
    }

    bool isUnscoped() const { return !validFrom && !validTo; }
};

using ScopedString = TimeScoped<std::string>;
using History = std::vector<ScopedString>;

/**
 * @brief Result of parsing "<text> (<start>:<end>)".
 */
struct ScopedText {
    std::string text;
    std::optional<TimePoint> validFrom;
    std::optional<TimePoint> validTo;
    // A range parenthetical was present, even if its bounds did not parse
    bool hadRange = false;

    bool hasBounds() const { return validFrom.has_value() || validTo.has_value(); }

    ScopedString toScoped() const { return ScopedString{text, validFrom, validTo}; }
};

enum class BoundKind { Start, End };

// 00:00:00 UTC of the given civil date
TimePoint makeDate(int year, unsigned month, unsigned day);

// YYYY-MM-DD (UTC)
std::string formatDate(TimePoint tp);

// Renders "[from..to]" with "*" for open bounds, used in log messages
std::string formatRange(const std::optional<TimePoint>& from, const std::optional<TimePoint>& to);

/**
 * @brief Parse a partial date into an instant.
 *
 * Accepts YYYY, YYYY-MM and YYYY-MM-DD. A start bound expands to the first instant of the
 * period, an end bound to its last representable instant. Returns nullopt for anything
 * unparseable.
 */
std::optional<TimePoint> parseDateBound(std::string_view fragment, BoundKind kind);

/**
 * @brief Parse a date used as a query instant ("active on").
 */
Result<TimePoint> parseInstant(std::string_view text);

/**
 * @brief Split a raw attribute value into text and validity range.
 *
 * Only a trailing parenthetical containing ':' is treated as a range. A range whose start
 * is after its end is dropped with a warning.
 */
ScopedText parseScopedValue(std::string_view raw);

template <typename T> bool isActiveAt(const TimeScoped<T>& value, std::optional<TimePoint> at) {
    return value.isActiveAt(at);
}

// Stable sort by validFrom, entries without a start first
template <typename T> void sortHistory(std::vector<TimeScoped<T>>& history) {
    std::stable_sort(history.begin(), history.end(),
                     [](const TimeScoped<T>& a, const TimeScoped<T>& b) {
                         if (!a.validFrom) {
                             return b.validFrom.has_value();
                         }
                         if (!b.validFrom) {
                             return false;
                         }
                         return *a.validFrom < *b.validFrom;
                     });
}

// Last entry of a sorted history active at `at`
template <typename T>
const TimeScoped<T>* lastActive(const std::vector<TimeScoped<T>>& history,
                                std::optional<TimePoint> at) {
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (it->isActiveAt(at)) {
            return &*it;
        }
    }
    return nullptr;
}

// Every entry of a sorted history active at `at`, in history order
template <typename T>
std::vector<const TimeScoped<T>*> allActive(const std::vector<TimeScoped<T>>& history,
                                            std::optional<TimePoint> at) {
    std::vector<const TimeScoped<T>*> out;
    for (const auto& entry : history) {
        if (entry.isActiveAt(at)) {
            out.push_back(&entry);
        }
    }
    return out;
}

// Active values of a multi-valued string history, de-duplicated case-insensitively
std::vector<std::string> activeValues(const History& history, std::optional<TimePoint> at);

// Active value of a single-valued string history
std::optional<std::string> activeValue(const History& history, std::optional<TimePoint> at);

} // namespace lore::temporal
