#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <lore/world/world_builder.h>

#include "../../common/test_helpers.h"

using namespace lore;
using namespace lore::world;
using lore::entity::EntityStatus;
using lore::entity::PlayerRecord;
using lore::overlay::ChangeRecord;
using lore::temporal::makeDate;
using lore::tests::SourceBuilder;

class WorldBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        core_ = SourceBuilder("core")
                    .section("NPC")
                    .declare("Korm Blackhand")
                    .declare("Sandro")
                    .line("alias: Mroczny Mag")
                    .section("Lokacje")
                    .declare("Erathia")
                    .declare("Zamek Steadwick")
                    .line("location: Erathia (2021-01-01:)")
                    .section("Player Characters")
                    .declare("Xeron Demonlord")
                    .build();
        campaign_ = SourceBuilder("campaign")
                        .section("NPC")
                        .declare("Sandro")
                        .line("alias: Lich z Deyji (2024-01:)")
                        .build();

        config_.activeOn = makeDate(2026, 3, 1);
    }

    entity::DeclarationSource core_;
    entity::DeclarationSource campaign_;
    config::EngineConfig config_;
};

TEST_F(WorldBuilderTest, BuildsStoreIndexAndResolver) {
    auto built = WorldBuilder(config_).addSource(core_).addSource(campaign_).build();
    ASSERT_TRUE(built) << built.error().message;
    const auto& world = built.value();

    EXPECT_EQ(world.store->size(), 5u);
    EXPECT_EQ(world.store->get("Zamek Steadwick")->canonicalName,
              "Location/Erathia/Zamek Steadwick");

    // Aliases from both sources resolve to the same entity
    const auto sandro = world.store->find("Sandro");
    auto first = world.resolver->resolve("Mroczny Mag");
    auto second = world.resolver->resolve("Lich z Deyji");
    ASSERT_TRUE(first.resolved());
    ASSERT_TRUE(second.resolved());
    EXPECT_EQ(first.owner->id, *sandro);
    EXPECT_EQ(second.owner->id, *sandro);

    EXPECT_EQ(world.overlay.applied, 0u);
}

TEST_F(WorldBuilderTest, OverlayIsAppliedAndIndexRebuilt) {
    auto built = WorldBuilder(config_)
                     .addSource(core_)
                     .addChange(ChangeRecord{makeDate(2026, 2, 1),
                                             "Korm",
                                             {{"status", "Removed"}, {"alias", "Czarna Ręka"}}})
                     .build();
    ASSERT_TRUE(built) << built.error().message;
    const auto& world = built.value();

    EXPECT_EQ(world.overlay.applied, 1u);
    EXPECT_EQ(world.overlay.entriesAppended, 2u);

    const auto* korm = world.store->get("Korm Blackhand");
    ASSERT_NE(korm, nullptr);
    EXPECT_EQ(korm->active.status, EntityStatus::Removed);
    EXPECT_EQ(korm->activeStatus(makeDate(2025, 12, 1)), EntityStatus::Active);

    // Alias introduced by the event is searchable after the rebuild
    auto byAlias = world.resolveEntity("czarna ręka");
    ASSERT_TRUE(byAlias);
    EXPECT_EQ(byAlias.value(), *world.store->find("Korm Blackhand"));
    auto byToken = world.resolver->resolve("Ręka");
    ASSERT_TRUE(byToken.resolved());
    EXPECT_EQ(byToken.owner->id, *world.store->find("Korm Blackhand"));
}

TEST_F(WorldBuilderTest, PlayersAreLinkedToTheirCharacters) {
    auto built = WorldBuilder(config_)
                     .addSource(core_)
                     .addPlayer(PlayerRecord{"Marek", {"Xeron Demonlord"}})
                     .build();
    ASSERT_TRUE(built);
    const auto& world = built.value();

    auto id = world.resolveEntity("Marek");
    ASSERT_TRUE(id);
    EXPECT_EQ(id.value(), *world.store->find("Xeron Demonlord"));

    auto unknown = world.resolveEntity("Nieznany Smok");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);
}

TEST_F(WorldBuilderTest, ConfigFlowsIntoIndexAndResolver) {
    config_.minTokenLength = 6;
    config_.strictFuzzyTies = true;
    config_.enableCache = false;

    auto built = WorldBuilder(config_).addSource(core_).build();
    ASSERT_TRUE(built);
    const auto& world = built.value();

    EXPECT_EQ(world.index->options().minTokenLength, 6u);
    EXPECT_EQ(world.index->find("korm"), nullptr);
    EXPECT_NE(world.index->find("blackhand"), nullptr);
    EXPECT_EQ(world.resolver->cacheStats().entries, 0u);
}

TEST_F(WorldBuilderTest, InvalidConfigIsRejected) {
    config_.minTokenLength = 0;
    auto built = WorldBuilder(config_).addSource(core_).build();
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, ErrorCode::InvalidArgument);
}

TEST_F(WorldBuilderTest, WorldSurvivesMove) {
    auto built = WorldBuilder(config_).addSource(core_).build();
    ASSERT_TRUE(built);

    World world = std::move(built).value();
    auto result = world.resolver->resolve("Sandro");
    ASSERT_TRUE(result.resolved());
    EXPECT_EQ(world.index->displayName(*result.owner), "Sandro");
}
