#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <lore/entity/entity_store.h>

#include "../../common/test_helpers.h"

using namespace lore;
using namespace lore::entity;
using lore::temporal::makeDate;
using lore::tests::SourceBuilder;

class EntityStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        core_ = SourceBuilder("core")
                    .section("NPC")
                    .declare("Sandro")
                    .line("location: Erathia")
                    .line("alias: Mroczny Mag")
                    .line("group: Nekromanci")
                    .section("Lokacje")
                    .declare("Erathia")
                    .declare("Zamek Steadwick")
                    .line("location: Erathia (2021-01-01:)")
                    .build();

        campaign_ = SourceBuilder("campaign")
                        .section("npcs")
                        .declare("sandro")
                        .line("location: Deyja (2024-01:)")
                        .line("alias: Lich z Deyji (2024-01:)")
                        .build();
    }

    entity::DeclarationSource core_;
    entity::DeclarationSource campaign_;
};

TEST_F(EntityStoreTest, SectionLabelsMapToTypes) {
    EntityStore store;
    EXPECT_EQ(store.typeForSection("NPC"), EntityType::NPC);
    EXPECT_EQ(store.typeForSection("npcs"), EntityType::NPC);
    EXPECT_EQ(store.typeForSection("Organizations"), EntityType::Organization);
    EXPECT_EQ(store.typeForSection("Lokacje"), EntityType::Location);
    EXPECT_EQ(store.typeForSection("Player Characters"), EntityType::PlayerCharacter);
    EXPECT_EQ(store.typeForSection("Postacie Graczy"), EntityType::PlayerCharacter);
    EXPECT_EQ(store.typeForSection("Gracze"), EntityType::Player);
    EXPECT_EQ(store.typeForSection("Przedmioty"), EntityType::Item);
    EXPECT_FALSE(store.typeForSection("Notatki").has_value());

    EntityStoreOptions options;
    options.extraSectionLabels.emplace("Bestiariusz", EntityType::NPC);
    EntityStore custom(options);
    EXPECT_EQ(custom.typeForSection("bestiariusz"), EntityType::NPC);
}

TEST_F(EntityStoreTest, MergesDeclarationsAcrossSources) {
    auto store = tests::buildStore({core_, campaign_});

    ASSERT_EQ(store.size(), 3u);
    const auto* sandro = store.get("SANDRO");
    ASSERT_NE(sandro, nullptr);
    EXPECT_EQ(sandro->name, "Sandro");
    EXPECT_EQ(sandro->type, EntityType::NPC);
    EXPECT_EQ(sandro->location.size(), 2u);
    EXPECT_EQ(sandro->aliases.size(), 2u);

    // Both aliases are names of the merged entity
    EXPECT_TRUE(sandro->hasName("Mroczny Mag"));
    EXPECT_TRUE(sandro->hasName("lich z deyji"));
    EXPECT_EQ(store.findByAnyName("Mroczny Mag"), store.find("Sandro"));
    EXPECT_EQ(store.findByAnyName("Lich z Deyji"), store.find("Sandro"));
}

TEST_F(EntityStoreTest, ActiveProjectionFollowsActiveOn) {
    EntityStoreOptions before;
    before.activeOn = makeDate(2023, 6, 1);
    auto early = tests::buildStore({core_, campaign_}, before);
    const auto* sandro = early.get("Sandro");
    ASSERT_NE(sandro, nullptr);
    EXPECT_EQ(sandro->active.location, "Erathia");
    EXPECT_EQ(sandro->active.aliases, (std::vector<std::string>{"Mroczny Mag"}));

    EntityStoreOptions after;
    after.activeOn = makeDate(2024, 6, 1);
    auto late = tests::buildStore({core_, campaign_}, after);
    sandro = late.get("Sandro");
    ASSERT_NE(sandro, nullptr);
    EXPECT_EQ(sandro->active.location, "Deyja");
    EXPECT_EQ(sandro->active.aliases,
              (std::vector<std::string>{"Mroczny Mag", "Lich z Deyji"}));
    EXPECT_EQ(sandro->active.groups, (std::vector<std::string>{"Nekromanci"}));
    EXPECT_EQ(sandro->active.status, EntityStatus::Active);
}

TEST_F(EntityStoreTest, LastActiveWinsRegardlessOfSourceOrder) {
    EntityStoreOptions options;
    options.activeOn = makeDate(2025, 1, 1);

    auto forward = tests::buildStore({core_, campaign_}, options);
    auto backward = tests::buildStore({campaign_, core_}, options);

    EXPECT_EQ(forward.get("Sandro")->active.location, "Deyja");
    EXPECT_EQ(backward.get("Sandro")->active.location, "Deyja");
}

TEST_F(EntityStoreTest, MergingTheSameSourceTwiceKeepsProjections) {
    EntityStoreOptions options;
    options.activeOn = makeDate(2025, 1, 1);

    auto once = tests::buildStore({core_, campaign_}, options);
    auto twice = tests::buildStore({core_, campaign_, campaign_, core_}, options);

    ASSERT_EQ(once.size(), twice.size());
    for (const auto& entity : once.entities()) {
        const auto* other = twice.get(entity.name);
        ASSERT_NE(other, nullptr) << entity.name;
        EXPECT_EQ(entity.active.location, other->active.location) << entity.name;
        EXPECT_EQ(entity.active.aliases, other->active.aliases) << entity.name;
        EXPECT_EQ(entity.active.groups, other->active.groups) << entity.name;
        EXPECT_EQ(entity.active.status, other->active.status) << entity.name;
        EXPECT_EQ(entity.canonicalName, other->canonicalName) << entity.name;
    }
    // Duplicates accumulate in the raw history
    EXPECT_EQ(twice.get("Sandro")->location.size(), 4u);
}

TEST_F(EntityStoreTest, TypeConflictKeepsFirstType) {
    auto other = SourceBuilder("other").section("Items").declare("Sandro").build();
    auto store = tests::buildStore({core_, other});

    EXPECT_EQ(store.get("Sandro")->type, EntityType::NPC);
    ASSERT_EQ(store.warnings().size(), 1u);
    EXPECT_NE(store.warnings().front().find("Sandro"), std::string::npos);
}

TEST_F(EntityStoreTest, MalformedLinesAreSkipped) {
    auto messy = SourceBuilder("messy")
                     .section("NPC")
                     .declare("Korm Blackhand")
                     .line("no separator here")
                     .line(": orphan value")
                     .line("owner:   ")
                     .line("status: Inactive")
                     .declare("   ")
                     .line("location: Nowhere")
                     .section("Notatki")
                     .declare("Ignored")
                     .build();
    auto store = tests::buildStore({messy});

    ASSERT_EQ(store.size(), 1u);
    const auto* korm = store.get("Korm Blackhand");
    ASSERT_NE(korm, nullptr);
    EXPECT_EQ(korm->active.status, EntityStatus::Inactive);
    EXPECT_TRUE(korm->owner.empty());

    auto stats = store.getStats();
    EXPECT_EQ(stats.skippedLines, 3u);
    EXPECT_EQ(stats.skippedSections, 1u);
    // Three bad lines plus the unnamed declaration
    EXPECT_EQ(store.warnings().size(), 4u);
}

TEST_F(EntityStoreTest, ContinuationLinesJoinWithNewline) {
    auto src = SourceBuilder("notes")
                   .section("NPC")
                   .declare("Sandro")
                   .line("opis: Nekromanta", {"  z Deyji  ", "", "i okolic"})
                   .build();
    auto store = tests::buildStore({src});

    EXPECT_EQ(store.get("Sandro")->activeOverride("Opis"), "Nekromanta\nz Deyji\ni okolic");
}

TEST_F(EntityStoreTest, KnownTagsAndOverrides) {
    auto src = SourceBuilder("tags")
                   .section("Items")
                   .declare("Miecz Armageddonu")
                   .line("Właściciel: Sandro (2025-01:)")
                   .line("ilość: 1")
                   .line("nazwa: miecz")
                   .line("Kolor: czarny")
                   .line("kolor: czerwony (2025-06:)")
                   .section("Lokacje")
                   .declare("Erathia")
                   .line("zawiera: Zamek Steadwick, Tatalia , zamek steadwick")
                   .build();

    EntityStoreOptions options;
    options.activeOn = makeDate(2025, 7, 1);
    auto store = tests::buildStore({src}, options);

    const auto* sword = store.get("Miecz Armageddonu");
    ASSERT_NE(sword, nullptr);
    EXPECT_EQ(sword->active.owner, "Sandro");
    EXPECT_EQ(sword->active.quantity, "1");
    EXPECT_EQ(sword->genericNames, (std::vector<std::string>{"miecz"}));
    EXPECT_TRUE(sword->hasName("Miecz"));

    ASSERT_EQ(sword->overrides.size(), 1u);
    EXPECT_EQ(sword->overrides.begin()->first, "Kolor");
    EXPECT_EQ(sword->activeOverride("KOLOR", options.activeOn), "czerwony");
    EXPECT_EQ(sword->activeOverride("kolor", makeDate(2025, 1, 1)), "czarny");

    const auto* erathia = store.get("Erathia");
    ASSERT_NE(erathia, nullptr);
    EXPECT_EQ(erathia->contains, (std::vector<std::string>{"Zamek Steadwick", "Tatalia"}));
}

TEST_F(EntityStoreTest, StatusIsNormalized) {
    auto src = SourceBuilder("status")
                   .section("NPC")
                   .declare("Korm Blackhand")
                   .line("status: usunięty (2026-02-01:)")
                   .build();
    auto store = tests::buildStore({src});

    const auto* korm = store.get("Korm Blackhand");
    ASSERT_EQ(korm->status.size(), 1u);
    EXPECT_EQ(korm->status.front().value, "Removed");
    EXPECT_EQ(korm->activeStatus(makeDate(2026, 3, 1)), EntityStatus::Removed);
    EXPECT_EQ(korm->activeStatus(makeDate(2025, 12, 1)), EntityStatus::Active);
}

TEST_F(EntityStoreTest, StatsCountPerType) {
    auto store = tests::buildStore({core_, campaign_});
    auto stats = store.getStats();

    EXPECT_EQ(stats.entityCount, 3u);
    EXPECT_EQ(stats.perType[EntityType::NPC], 1u);
    EXPECT_EQ(stats.perType[EntityType::Location], 2u);
    // Sandro: 2 locations, 2 aliases, 1 group; Steadwick: 1 location
    EXPECT_EQ(stats.historyEntries, 6u);
}

TEST_F(EntityStoreTest, RefreshRederivesActiveState) {
    EntityStoreOptions options;
    options.activeOn = makeDate(2026, 3, 1);
    auto store = tests::buildStore({core_}, options);
    auto id = store.find("Sandro");
    ASSERT_TRUE(id.has_value());

    store.at(*id).applyAttribute("location",
                                 temporal::parseScopedValue("Bracada (2026-02-01:)"));
    EXPECT_EQ(store.at(*id).active.location, "Erathia");

    store.refresh({*id});
    EXPECT_EQ(store.at(*id).active.location, "Bracada");
}
