#include <chrono>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <lore/temporal/time_scoped.h>

using namespace lore;
using namespace lore::temporal;

class TimeScopedTest : public ::testing::Test {
protected:
    static ScopedString scoped(std::string value, std::optional<TimePoint> from = std::nullopt,
                               std::optional<TimePoint> to = std::nullopt) {
        return ScopedString{std::move(value), from, to};
    }
};

TEST_F(TimeScopedTest, UnscopedValueIsAlwaysActive) {
    auto v = scoped("Erathia");
    EXPECT_TRUE(v.isUnscoped());
    EXPECT_TRUE(v.isActiveAt(std::nullopt));
    EXPECT_TRUE(v.isActiveAt(makeDate(1200, 1, 1)));
    EXPECT_TRUE(v.isActiveAt(makeDate(3000, 12, 31)));
}

TEST_F(TimeScopedTest, BoundsAreInclusive) {
    const auto from = makeDate(2025, 1, 1);
    const auto to = makeDate(2025, 6, 30);
    auto v = scoped("Erathia", from, to);

    EXPECT_TRUE(v.isActiveAt(from));
    EXPECT_TRUE(v.isActiveAt(to));
    EXPECT_FALSE(v.isActiveAt(from - std::chrono::seconds{1}));
    EXPECT_FALSE(v.isActiveAt(to + std::chrono::seconds{1}));
    // No query instant means "ignore time"
    EXPECT_TRUE(v.isActiveAt(std::nullopt));
}

TEST_F(TimeScopedTest, OpenEndedBounds) {
    auto since = scoped("Guard", makeDate(2025, 3, 1), std::nullopt);
    EXPECT_FALSE(since.isActiveAt(makeDate(2025, 2, 28)));
    EXPECT_TRUE(since.isActiveAt(makeDate(2099, 1, 1)));

    auto until = scoped("Guard", std::nullopt, makeDate(2025, 3, 1));
    EXPECT_TRUE(until.isActiveAt(makeDate(1900, 1, 1)));
    EXPECT_FALSE(until.isActiveAt(makeDate(2025, 3, 2)));
}

TEST_F(TimeScopedTest, FormatDate) {
    EXPECT_EQ(formatDate(makeDate(2026, 2, 1)), "2026-02-01");
    EXPECT_EQ(formatRange(std::nullopt, makeDate(2026, 2, 1)), "[*..2026-02-01]");
    EXPECT_EQ(formatRange(makeDate(2025, 12, 31), std::nullopt), "[2025-12-31..*]");
}

TEST_F(TimeScopedTest, ParseDateBoundPartialDates) {
    using namespace std::chrono;

    EXPECT_EQ(parseDateBound("2025", BoundKind::Start), makeDate(2025, 1, 1));
    EXPECT_EQ(parseDateBound("2025", BoundKind::End),
              makeDate(2026, 1, 1) - TimePoint::duration{1});

    EXPECT_EQ(parseDateBound("2025-03", BoundKind::Start), makeDate(2025, 3, 1));
    EXPECT_EQ(parseDateBound("2024-02", BoundKind::End),
              makeDate(2024, 3, 1) - TimePoint::duration{1});

    EXPECT_EQ(parseDateBound(" 2025-03-15 ", BoundKind::Start), makeDate(2025, 3, 15));
    EXPECT_EQ(parseDateBound("2025-03-15", BoundKind::End),
              makeDate(2025, 3, 16) - TimePoint::duration{1});
}

TEST_F(TimeScopedTest, EndBoundCoversLastSecondOfPeriod) {
    using namespace std::chrono;

    auto v = parseScopedValue("Straż (:2025-03-15)");
    ASSERT_TRUE(v.validTo.has_value());
    const auto lastSecond = makeDate(2025, 3, 15) + hours{23} + minutes{59} + seconds{59};
    EXPECT_TRUE(v.toScoped().isActiveAt(lastSecond + milliseconds{500}));
    EXPECT_FALSE(v.toScoped().isActiveAt(makeDate(2025, 3, 16)));
}

TEST_F(TimeScopedTest, ParseDateBoundRejectsGarbage) {
    EXPECT_FALSE(parseDateBound("", BoundKind::Start).has_value());
    EXPECT_FALSE(parseDateBound("25", BoundKind::Start).has_value());
    EXPECT_FALSE(parseDateBound("2025-13", BoundKind::Start).has_value());
    EXPECT_FALSE(parseDateBound("2025-02-30", BoundKind::Start).has_value());
    EXPECT_FALSE(parseDateBound("2025/03/01", BoundKind::Start).has_value());
    EXPECT_FALSE(parseDateBound("wiosna 2025", BoundKind::End).has_value());
}

TEST_F(TimeScopedTest, ParseInstant) {
    auto ok = parseInstant("2026-02-01");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), makeDate(2026, 2, 1));

    auto bad = parseInstant("yesterday");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::ParseError);
}

TEST_F(TimeScopedTest, ParseScopedValueWithRange) {
    using namespace std::chrono;

    auto v = parseScopedValue("Erathia (2025-01:2025-06)");
    EXPECT_EQ(v.text, "Erathia");
    EXPECT_TRUE(v.hadRange);
    EXPECT_EQ(v.validFrom, makeDate(2025, 1, 1));
    EXPECT_EQ(v.validTo, makeDate(2025, 7, 1) - TimePoint::duration{1});
}

TEST_F(TimeScopedTest, ParseScopedValueOpenSides) {
    auto from = parseScopedValue("Steadwick (2025-02-01:)");
    EXPECT_EQ(from.text, "Steadwick");
    EXPECT_EQ(from.validFrom, makeDate(2025, 2, 1));
    EXPECT_FALSE(from.validTo.has_value());

    auto to = parseScopedValue("Steadwick (:2024)");
    EXPECT_FALSE(to.validFrom.has_value());
    ASSERT_TRUE(to.validTo.has_value());

    auto none = parseScopedValue("Steadwick (:)");
    EXPECT_TRUE(none.hadRange);
    EXPECT_FALSE(none.hasBounds());
}

TEST_F(TimeScopedTest, ParseScopedValueWithoutRange) {
    auto plain = parseScopedValue("  Erathia  ");
    EXPECT_EQ(plain.text, "Erathia");
    EXPECT_FALSE(plain.hadRange);
    EXPECT_FALSE(plain.hasBounds());

    // A parenthetical without ':' is part of the value
    auto note = parseScopedValue("Zamek (ruiny)");
    EXPECT_EQ(note.text, "Zamek (ruiny)");
    EXPECT_FALSE(note.hadRange);
}

TEST_F(TimeScopedTest, ParseScopedValueUnparseableBoundIsOpen) {
    auto v = parseScopedValue("Erathia (kiedyś:2025)");
    EXPECT_EQ(v.text, "Erathia");
    EXPECT_TRUE(v.hadRange);
    EXPECT_FALSE(v.validFrom.has_value());
    EXPECT_TRUE(v.validTo.has_value());
}

TEST_F(TimeScopedTest, ParseScopedValueInvertedRangeIsDropped) {
    auto v = parseScopedValue("Erathia (2026:2025)");
    EXPECT_EQ(v.text, "Erathia");
    EXPECT_TRUE(v.hadRange);
    EXPECT_FALSE(v.hasBounds());
}

TEST_F(TimeScopedTest, SortHistoryPutsUnboundedStartFirstAndIsStable) {
    History h{
        scoped("c", makeDate(2025, 3, 1)),
        scoped("a"),
        scoped("b", makeDate(2025, 1, 1)),
        scoped("a2"),
        scoped("c2", makeDate(2025, 3, 1)),
    };
    sortHistory(h);

    std::vector<std::string> order;
    for (const auto& e : h) {
        order.push_back(e.value);
    }
    EXPECT_EQ(order, (std::vector<std::string>{"a", "a2", "b", "c", "c2"}));
}

TEST_F(TimeScopedTest, ActiveValueTakesLastActiveEntry) {
    History h{
        scoped("Erathia"),
        scoped("Steadwick", makeDate(2025, 1, 1), makeDate(2025, 12, 31)),
        scoped("Bracada", makeDate(2026, 1, 1)),
    };
    sortHistory(h);

    EXPECT_EQ(activeValue(h, makeDate(2024, 6, 1)), "Erathia");
    EXPECT_EQ(activeValue(h, makeDate(2025, 6, 1)), "Steadwick");
    EXPECT_EQ(activeValue(h, makeDate(2026, 6, 1)), "Bracada");
    // Unscoped query sees every entry; the latest one wins
    EXPECT_EQ(activeValue(h, std::nullopt), "Bracada");

    EXPECT_FALSE(activeValue(History{}, std::nullopt).has_value());
}

TEST_F(TimeScopedTest, ActiveValuesDeduplicateCaseInsensitively) {
    History h{
        scoped("Straż"),
        scoped("STRAŻ", makeDate(2025, 1, 1)),
        scoped("Gildia", makeDate(2025, 1, 1), makeDate(2025, 1, 31)),
    };
    sortHistory(h);

    EXPECT_EQ(activeValues(h, makeDate(2025, 1, 15)),
              (std::vector<std::string>{"Straż", "Gildia"}));
    EXPECT_EQ(activeValues(h, makeDate(2025, 6, 1)), (std::vector<std::string>{"Straż"}));
    EXPECT_EQ(activeValues(h, makeDate(2024, 6, 1)), (std::vector<std::string>{"Straż"}));
}
