#pragma once

#include <lore/config/engine_config.h>
#include <lore/core/types.h>
#include <lore/entity/declaration.h>
#include <lore/entity/entity_store.h>
#include <lore/entity/identity.h>
#include <lore/overlay/event_overlay.h>
#include <lore/search/fuzzy_resolver.h>
#include <lore/search/name_index.h>

#include <memory>
#include <vector>

namespace lore::world {

/**
 * @brief Fully built state: merged store, name index, resolver and overlay outcome.
 *
 * The index points into the store and the resolver into the index, so each lives on the
 * heap and keeps its address when the World is moved.
 */
struct World {
    std::unique_ptr<entity::EntityStore> store;
    std::unique_ptr<search::NameIndex> index;
    std::unique_ptr<search::FuzzyResolver> resolver;
    overlay::OverlayReport overlay;

    // Resolve a free-form reference to the entity it names, following player links
    Result<EntityId> resolveEntity(const std::string& query) const;
};

/**
 * @brief Runs the whole pipeline from declarations to a queryable World.
 *
 * Order: merge sources, index names, build the resolver, replay change records, then
 * rebuild the index and resolver so names introduced by events are searchable.
 */
class WorldBuilder {
public:
    explicit WorldBuilder(config::EngineConfig config = {});

    WorldBuilder& addSource(entity::DeclarationSource source);
    WorldBuilder& addPlayer(entity::PlayerRecord player);
    WorldBuilder& addChange(overlay::ChangeRecord record);

    Result<World> build() const;

    const config::EngineConfig& config() const { return config_; }

private:
    Result<std::unique_ptr<search::NameIndex>> buildIndex(const entity::EntityStore& store) const;
    search::FuzzyResolverOptions resolverOptions() const;

    config::EngineConfig config_;
    std::vector<entity::DeclarationSource> sources_;
    std::vector<entity::PlayerRecord> players_;
    std::vector<overlay::ChangeRecord> changes_;
};

} // namespace lore::world
